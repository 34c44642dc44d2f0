#ifndef JOB_H
#define JOB_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

using JobId = uint64_t;

/**
 * @brief Scheduling priority, highest first
 *
 * The scheduler always drains a higher level completely before looking at a
 * lower one; submission order only matters within a single level.
 */
enum class JobPriority
{
    Visible = 0,    // Tiles currently on screen
    Margin,         // Tiles just outside the viewport (scroll-ahead)
    Adjacent,       // Tiles of the previous/next page
    Thumbnails,     // Sidebar thumbnails and the rest of the current page
    Ocr             // Background text recognition, runs when idle
};

constexpr size_t JOB_PRIORITY_LEVELS = 5;

constexpr std::array<JobPriority, JOB_PRIORITY_LEVELS> ALL_JOB_PRIORITIES = {
    JobPriority::Visible, JobPriority::Margin, JobPriority::Adjacent, JobPriority::Thumbnails, JobPriority::Ocr};

const char* jobPriorityName(JobPriority priority);

struct RenderTileJob
{
    uint16_t pageIndex = 0;
    uint32_t tileX = 0;
    uint32_t tileY = 0;
    uint32_t zoomLevel = 100; // Percent
    uint16_t rotation = 0;    // Degrees, multiple of 90
    bool isPreview = false;

    bool operator==(const RenderTileJob& other) const
    {
        return pageIndex == other.pageIndex && tileX == other.tileX && tileY == other.tileY &&
               zoomLevel == other.zoomLevel && rotation == other.rotation && isPreview == other.isPreview;
    }
};

struct GenerateThumbnailJob
{
    uint16_t pageIndex = 0;
    uint32_t width = 0;
    uint32_t height = 0;

    bool operator==(const GenerateThumbnailJob& other) const
    {
        return pageIndex == other.pageIndex && width == other.width && height == other.height;
    }
};

struct RunOcrJob
{
    uint16_t pageIndex = 0;

    bool operator==(const RunOcrJob& other) const
    {
        return pageIndex == other.pageIndex;
    }
};

struct ExtractTextJob
{
    uint16_t pageIndex = 0;

    bool operator==(const ExtractTextJob& other) const
    {
        return pageIndex == other.pageIndex;
    }
};

struct LoadFileJob
{
    std::string path;

    bool operator==(const LoadFileJob& other) const
    {
        return path == other.path;
    }
};

using JobType = std::variant<RenderTileJob, GenerateThumbnailJob, RunOcrJob, ExtractTextJob, LoadFileJob>;

/**
 * @brief Page index carried by a job, if any (LoadFile carries none)
 */
std::optional<uint16_t> jobPageIndex(const JobType& jobType);

bool isLoadFileJob(const JobType& jobType);

std::string describeJobType(const JobType& jobType);

/**
 * @brief A queued unit of work. Immutable once submitted.
 */
struct Job
{
    JobId id = 0;
    JobPriority priority = JobPriority::Visible;
    JobType jobType;
};

#endif // JOB_H
