#include "services/qa/qa_pipeline.hpp"
#include "services/qa/report_assembler.hpp"
#include "services/render/svg_plot_renderer.hpp"

#include "core/archive_ingestor.hpp"
#include "core/dicom_detector.hpp"
#include "core/dicom_loader.hpp"
#include "core/logging.hpp"

namespace acr_qa::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("QaPipeline");
    return logger;
}

} // anonymous namespace

class QaPipeline::Impl {
public:
    Impl(std::shared_ptr<const core::IDicomReader> reader,
         std::filesystem::path plotDirectory,
         EngineOptions options)
        : detector(reader)
        , loader(reader)
        , engine(std::move(options))
        , plotDirectory(std::move(plotDirectory)) {}

    core::ArchiveIngestor ingestor;
    core::DicomDetector detector;
    core::DicomLoader loader;
    QaMetricsEngine engine;
    std::filesystem::path plotDirectory;
};

QaPipeline::QaPipeline(std::shared_ptr<const core::IDicomReader> reader,
                       std::filesystem::path plotDirectory,
                       EngineOptions options)
    : impl_(std::make_unique<Impl>(std::move(reader), std::move(plotDirectory),
                                   std::move(options))) {}

QaPipeline::~QaPipeline() = default;

QaPipeline::QaPipeline(QaPipeline&&) noexcept = default;
QaPipeline& QaPipeline::operator=(QaPipeline&&) noexcept = default;

Report QaPipeline::runOnDirectory(const std::filesystem::path& workDirectory) const {
    auto files = impl_->detector.findDicomFiles(workDirectory);
    getLogger()->info("Detected {} DICOM files under {}", files.size(), workDirectory.string());

    if (files.empty()) {
        getLogger()->warn("No DICOM files found under {}", workDirectory.string());
        return ReportAssembler::error(kNoDicomMessage);
    }

    core::LoadStatistics statistics;
    auto datasets = impl_->loader.loadAll(files, &statistics);
    getLogger()->info("Loaded {}/{} datasets ({} without pixel data, {} failed)",
                      statistics.loaded, statistics.requested,
                      statistics.withoutPixelData, statistics.failed);

    return impl_->engine.run(datasets, impl_->plotDirectory, files.size());
}

Report QaPipeline::runOnArchive(const std::filesystem::path& archivePath,
                                const std::filesystem::path& workDirectory) const {
    auto summary = impl_->ingestor.extractFile(archivePath, workDirectory);
    if (!summary) {
        getLogger()->error("Failed to ingest {}: {}", archivePath.string(),
                           summary.error().toString());
        return ReportAssembler::error(summary.error().toString());
    }

    getLogger()->info("Extracted {} files from {} ({} entries skipped)",
                      summary->filesWritten, archivePath.filename().string(),
                      summary->skippedCount());
    return runOnDirectory(workDirectory);
}

Report QaPipeline::runOnUpload(const std::filesystem::path& archivePath,
                               const std::filesystem::path& workRoot) const {
    auto jobDirectory = newJobDirectory(workRoot);
    getLogger()->info("Job directory for {}: {}", archivePath.filename().string(),
                      jobDirectory.string());
    return runOnArchive(archivePath, jobDirectory);
}

std::filesystem::path QaPipeline::newJobDirectory(const std::filesystem::path& workRoot) {
    std::error_code ec;
    std::filesystem::path candidate;
    do {
        candidate = workRoot / ("job_" + SvgPlotRenderer::generateUniqueId());
    } while (std::filesystem::exists(candidate, ec));
    return candidate;
}

std::expected<void, SerializationError>
QaPipeline::writeReport(const Report& report, const std::filesystem::path& filePath) {
    auto result = ReportSerializer::save(report, filePath);
    if (!result) {
        getLogger()->error("Failed to write report to {}: {}", filePath.string(),
                           result.error().toString());
    }
    return result;
}

} // namespace acr_qa::services
