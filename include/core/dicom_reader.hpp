#pragma once

#include <expected>
#include <filesystem>

#include "core/dicom_dataset.hpp"

namespace acr_qa::core {

/**
 * @brief Interface for DICOM parsing backends
 *
 * Implementations hold no state between calls, so a single instance can be
 * injected into the detector and the loader of every pipeline run.
 */
class IDicomReader {
public:
    virtual ~IDicomReader() = default;

    /**
     * @brief Metadata-only parse restricted to the identifying attributes
     *
     * Must not decode pixel data and must tolerate files without the
     * 128-byte preamble and "DICM" marker.
     */
    [[nodiscard]] virtual std::expected<IdentifyingTags, DicomErrorInfo>
    readIdentifyingTags(const std::filesystem::path& filePath) const = 0;

    /**
     * @brief Full tolerant decode of tags and pixel data
     *
     * A file whose Pixel Data cannot be decoded is still returned, with
     * hasPixelData set and no pixel array.
     */
    [[nodiscard]] virtual std::expected<DicomDataset, DicomErrorInfo>
    readDataset(const std::filesystem::path& filePath) const = 0;
};

/**
 * @brief Production reader: GDCM for attributes, ITK GDCMImageIO for pixels
 */
class GdcmDicomReader final : public IDicomReader {
public:
    [[nodiscard]] std::expected<IdentifyingTags, DicomErrorInfo>
    readIdentifyingTags(const std::filesystem::path& filePath) const override;

    [[nodiscard]] std::expected<DicomDataset, DicomErrorInfo>
    readDataset(const std::filesystem::path& filePath) const override;
};

} // namespace acr_qa::core
