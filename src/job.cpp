#include "job.h"

#include <sstream>

namespace
{
// Overload set helper for std::visit
template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

const char* jobPriorityName(JobPriority priority)
{
    switch (priority)
    {
    case JobPriority::Visible:
        return "Visible";
    case JobPriority::Margin:
        return "Margin";
    case JobPriority::Adjacent:
        return "Adjacent";
    case JobPriority::Thumbnails:
        return "Thumbnails";
    case JobPriority::Ocr:
        return "Ocr";
    }
    return "Unknown";
}

std::optional<uint16_t> jobPageIndex(const JobType& jobType)
{
    return std::visit(Overloaded{
                          [](const RenderTileJob& job) -> std::optional<uint16_t> { return job.pageIndex; },
                          [](const GenerateThumbnailJob& job) -> std::optional<uint16_t> { return job.pageIndex; },
                          [](const RunOcrJob& job) -> std::optional<uint16_t> { return job.pageIndex; },
                          [](const ExtractTextJob& job) -> std::optional<uint16_t> { return job.pageIndex; },
                          [](const LoadFileJob&) -> std::optional<uint16_t> { return std::nullopt; },
                      },
                      jobType);
}

bool isLoadFileJob(const JobType& jobType)
{
    return std::holds_alternative<LoadFileJob>(jobType);
}

std::string describeJobType(const JobType& jobType)
{
    std::ostringstream oss;
    std::visit(Overloaded{
                   [&oss](const RenderTileJob& job)
                   {
                       oss << "RenderTile(page=" << job.pageIndex << ", tile=" << job.tileX << "," << job.tileY
                           << ", zoom=" << job.zoomLevel << ", rot=" << job.rotation
                           << (job.isPreview ? ", preview)" : ", crisp)");
                   },
                   [&oss](const GenerateThumbnailJob& job)
                   { oss << "GenerateThumbnail(page=" << job.pageIndex << ", " << job.width << "x" << job.height << ")"; },
                   [&oss](const RunOcrJob& job) { oss << "RunOcr(page=" << job.pageIndex << ")"; },
                   [&oss](const ExtractTextJob& job) { oss << "ExtractText(page=" << job.pageIndex << ")"; },
                   [&oss](const LoadFileJob& job) { oss << "LoadFile(" << job.path << ")"; },
               },
               jobType);
    return oss.str();
}
