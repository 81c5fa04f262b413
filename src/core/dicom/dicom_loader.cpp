#include "core/dicom_loader.hpp"
#include "core/dicom_reader.hpp"
#include "core/logging.hpp"

namespace acr_qa::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DicomLoader");
    return logger;
}

} // anonymous namespace

DicomLoader::DicomLoader(std::shared_ptr<const IDicomReader> reader)
    : reader_(std::move(reader)) {}

std::expected<DicomDataset, DicomErrorInfo>
DicomLoader::loadFile(const std::filesystem::path& filePath) const
{
    if (!reader_) {
        return std::unexpected(DicomErrorInfo{
            DicomError::DecodingFailed,
            "No DICOM reader configured"
        });
    }

    auto dataset = reader_->readDataset(filePath);
    if (!dataset) {
        return std::unexpected(dataset.error());
    }

    if (!dataset->hasPixelData) {
        return std::unexpected(DicomErrorInfo{
            DicomError::MissingPixelData,
            "No Pixel Data element: " + filePath.string()
        });
    }

    return std::move(*dataset);
}

std::vector<DicomDataset>
DicomLoader::loadAll(const std::vector<std::filesystem::path>& filePaths,
                     LoadStatistics* statistics) const
{
    LoadStatistics stats;
    stats.requested = filePaths.size();

    std::vector<DicomDataset> datasets;
    datasets.reserve(filePaths.size());

    for (const auto& path : filePaths) {
        auto dataset = loadFile(path);
        if (dataset) {
            datasets.push_back(std::move(*dataset));
            continue;
        }

        if (dataset.error().code == DicomError::MissingPixelData) {
            ++stats.withoutPixelData;
        } else {
            ++stats.failed;
        }
        getLogger()->debug("Skipping {}: {}", path.string(), dataset.error().message);
    }

    stats.loaded = datasets.size();
    getLogger()->info("Loaded {} of {} datasets ({} without pixel data, {} failed)",
                      stats.loaded, stats.requested, stats.withoutPixelData, stats.failed);

    if (statistics) {
        *statistics = stats;
    }
    return datasets;
}

} // namespace acr_qa::core
