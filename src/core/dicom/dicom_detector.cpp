#include "core/dicom_detector.hpp"
#include "core/dicom_reader.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <deque>
#include <fstream>

namespace acr_qa::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("DicomDetector");
    return logger;
}

constexpr std::size_t kMagicOffset = 128;
constexpr char kMagic[] = {'D', 'I', 'C', 'M'};

} // anonymous namespace

// =============================================================================
// CandidateFileSequence
// =============================================================================

struct CandidateFileSequence::Iterator::State {
    std::deque<std::filesystem::path> pendingFiles;
    std::vector<std::filesystem::path> directoryStack;
    std::filesystem::path current;
    bool done = false;

    void listDirectory(const std::filesystem::path& directory) {
        std::error_code ec;
        std::filesystem::directory_iterator it(
            directory, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec) {
            getLogger()->debug("Cannot list {}: {}", directory.string(), ec.message());
            return;
        }

        std::vector<std::filesystem::path> files;
        std::vector<std::filesystem::path> subdirectories;

        for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                getLogger()->debug("Listing of {} interrupted: {}", directory.string(), ec.message());
                break;
            }
            const auto& entry = *it;
            std::error_code statusEc;
            if (entry.is_directory(statusEc)) {
                if (!entry.is_symlink(statusEc)) {
                    subdirectories.push_back(entry.path());
                }
            } else if (entry.is_regular_file(statusEc)) {
                if (!isArchiveName(entry.path())) {
                    files.push_back(entry.path());
                }
            }
        }

        std::sort(files.begin(), files.end());
        std::sort(subdirectories.begin(), subdirectories.end());

        pendingFiles.insert(pendingFiles.end(), files.begin(), files.end());
        directoryStack.insert(directoryStack.end(),
                              subdirectories.rbegin(), subdirectories.rend());
    }
};

CandidateFileSequence::Iterator::Iterator(const std::filesystem::path& root)
    : state_(std::make_shared<State>())
{
    std::error_code ec;
    if (std::filesystem::is_directory(root, ec)) {
        state_->directoryStack.push_back(root);
    }
    advance();
}

CandidateFileSequence::Iterator::reference
CandidateFileSequence::Iterator::operator*() const {
    return state_->current;
}

CandidateFileSequence::Iterator& CandidateFileSequence::Iterator::operator++() {
    advance();
    return *this;
}

bool CandidateFileSequence::Iterator::atEnd() const {
    return !state_ || state_->done;
}

void CandidateFileSequence::Iterator::advance() {
    if (atEnd()) {
        return;
    }

    while (state_->pendingFiles.empty()) {
        if (state_->directoryStack.empty()) {
            state_->current.clear();
            state_->done = true;
            return;
        }
        auto directory = std::move(state_->directoryStack.back());
        state_->directoryStack.pop_back();
        state_->listDirectory(directory);
    }

    state_->current = std::move(state_->pendingFiles.front());
    state_->pendingFiles.pop_front();
}

CandidateFileSequence::CandidateFileSequence(std::filesystem::path root)
    : root_(std::move(root)) {}

CandidateFileSequence::Iterator CandidateFileSequence::begin() const {
    return Iterator(root_);
}

CandidateFileSequence::Iterator CandidateFileSequence::end() const {
    return Iterator();
}

bool CandidateFileSequence::isArchiveName(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    if (name.size() < 4) {
        return false;
    }
    std::string suffix = name.substr(name.size() - 4);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return suffix == ".zip";
}

// =============================================================================
// DicomDetector
// =============================================================================

DicomDetector::DicomDetector(std::shared_ptr<const IDicomReader> reader)
    : reader_(std::move(reader)) {}

DetectionOutcome DicomDetector::checkMagicHeader(const std::filesystem::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        return DetectionOutcome::NotFound;
    }

    std::array<char, kPreambleLength> preamble{};
    file.read(preamble.data(), static_cast<std::streamsize>(preamble.size()));
    if (file.gcount() < static_cast<std::streamsize>(kPreambleLength)) {
        return DetectionOutcome::NotFound;
    }

    return std::memcmp(preamble.data() + kMagicOffset, kMagic, sizeof(kMagic)) == 0
        ? DetectionOutcome::Found
        : DetectionOutcome::NotFound;
}

DetectionOutcome DicomDetector::checkIdentifyingTags(const std::filesystem::path& filePath) const {
    if (!reader_) {
        return DetectionOutcome::NotFound;
    }

    auto tags = reader_->readIdentifyingTags(filePath);
    if (!tags) {
        getLogger()->trace("Metadata parse rejected {}: {}", filePath.string(), tags.error().message);
        return DetectionOutcome::NotFound;
    }
    return tags->identifiesDicom() ? DetectionOutcome::Found : DetectionOutcome::NotFound;
}

DetectionResult DicomDetector::classify(const std::filesystem::path& filePath) const {
    if (checkMagicHeader(filePath) == DetectionOutcome::Found) {
        return {DetectionOutcome::Found, DetectionStage::MagicHeader};
    }
    if (checkIdentifyingTags(filePath) == DetectionOutcome::Found) {
        return {DetectionOutcome::Found, DetectionStage::IdentifyingTags};
    }
    return {};
}

CandidateFile DicomDetector::inspect(const std::filesystem::path& filePath) const {
    return CandidateFile{filePath, classify(filePath).isDicom()};
}

std::vector<std::filesystem::path>
DicomDetector::findDicomFiles(const std::filesystem::path& root) const {
    std::vector<std::filesystem::path> found;
    size_t scanned = 0;

    for (const auto& path : CandidateFileSequence(root)) {
        ++scanned;
        auto candidate = inspect(path);
        if (candidate.looksLikeDicom) {
            found.push_back(std::move(candidate.path));
        } else {
            getLogger()->debug("Not DICOM: {}", path.string());
        }
    }

    getLogger()->info("Scanned {} files under {}, {} classified as DICOM",
                      scanned, root.string(), found.size());
    return found;
}

} // namespace acr_qa::core
