#include "core/dicom_reader.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <set>
#include <sstream>

#include <gdcmAttribute.h>
#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmTag.h>

#include <itkGDCMImageIO.h>
#include <itkImageFileReader.h>
#include <itkImageRegionIterator.h>

namespace acr_qa::core {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("GdcmDicomReader");
    return logger;
}

const gdcm::Tag kSOPClassUID{0x0008, 0x0016};
const gdcm::Tag kSOPInstanceUID{0x0008, 0x0018};
const gdcm::Tag kModality{0x0008, 0x0060};
const gdcm::Tag kPatientId{0x0010, 0x0020};
const gdcm::Tag kSliceThickness{0x0018, 0x0050};
const gdcm::Tag kStudyInstanceUID{0x0020, 0x000d};
const gdcm::Tag kSeriesInstanceUID{0x0020, 0x000e};
const gdcm::Tag kPixelSpacing{0x0028, 0x0030};
const gdcm::Tag kPixelData{0x7fe0, 0x0010};

/// Get string value from top-level GDCM DataSet, trailing padding removed
std::string getStringValue(const gdcm::DataSet& ds, const gdcm::Tag& tag) {
    if (!ds.FindDataElement(tag)) {
        return "";
    }
    const auto& de = ds.GetDataElement(tag);
    if (de.IsEmpty() || de.GetByteValue() == nullptr) {
        return "";
    }
    std::string value(de.GetByteValue()->GetPointer(),
                      de.GetByteValue()->GetLength());
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    size_t first = value.find_first_not_of(' ');
    return first == std::string::npos ? std::string{} : value.substr(first);
}

/// US attribute through the dictionary VR, so implicit VR files decode too
template <uint16_t Group, uint16_t Element>
std::optional<int> getUnsignedShort(const gdcm::DataSet& ds) {
    const gdcm::Tag tag{Group, Element};
    if (!ds.FindDataElement(tag) || ds.GetDataElement(tag).IsEmpty()) {
        return std::nullopt;
    }
    gdcm::Attribute<Group, Element> attribute;
    attribute.SetFromDataSet(ds);
    return static_cast<int>(attribute.GetValue());
}

std::vector<std::string> splitMultiValue(const std::string& value) {
    std::vector<std::string> parts;
    if (value.empty()) {
        return parts;
    }
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, '\\')) {
        parts.push_back(item);
    }
    return parts;
}

/// Map modality values back to stored values
void undoRescale(PixelImageType* image, double slope, double intercept) {
    if (slope == 0.0 || (slope == 1.0 && intercept == 0.0)) {
        return;
    }
    itk::ImageRegionIterator<PixelImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        it.Set(static_cast<float>(std::round((it.Get() - intercept) / slope)));
    }
}

/**
 * @brief Decode the first frame as stored pixel values
 *
 * GDCMImageIO applies Rescale Slope/Intercept while reading; the metrics
 * work on stored values, so the rescale is reverted. Images with more than
 * one sample per pixel are not decoded.
 */
PixelImageType::Pointer decodePixels(const std::filesystem::path& filePath) {
    using ReaderType = itk::ImageFileReader<PixelImageType>;

    try {
        auto imageIO = itk::GDCMImageIO::New();
        auto reader = ReaderType::New();
        reader->SetImageIO(imageIO);
        reader->SetFileName(filePath.string());
        reader->UpdateOutputInformation();

        if (imageIO->GetNumberOfComponents() != 1) {
            getLogger()->debug("Skipping pixel decode for {}: {} samples per pixel",
                               filePath.string(), imageIO->GetNumberOfComponents());
            return nullptr;
        }

        reader->Update();
        PixelImageType::Pointer image = reader->GetOutput();
        image->DisconnectPipeline();
        undoRescale(image.GetPointer(), imageIO->GetRescaleSlope(), imageIO->GetRescaleIntercept());
        return image;
    } catch (const itk::ExceptionObject& e) {
        getLogger()->debug("Pixel decode failed for {}: {}", filePath.string(), e.GetDescription());
    }
    return nullptr;
}

} // anonymous namespace

std::expected<IdentifyingTags, DicomErrorInfo>
GdcmDicomReader::readIdentifyingTags(const std::filesystem::path& filePath) const
{
    const std::set<gdcm::Tag> selected = {
        kSOPClassUID, kStudyInstanceUID, kSeriesInstanceUID,
        kSOPInstanceUID, kPatientId, kModality
    };

    gdcm::Reader reader;
    reader.SetFileName(filePath.string().c_str());

    bool ok = false;
    try {
        ok = reader.ReadSelectedTags(selected);
    } catch (const std::exception& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            std::string("Metadata parse failed: ") + e.what()
        });
    }

    if (!ok) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            "Not parseable as DICOM: " + filePath.string()
        });
    }

    const auto& ds = reader.GetFile().GetDataSet();

    IdentifyingTags tags;
    tags.sopClassUid = getStringValue(ds, kSOPClassUID);
    tags.studyInstanceUid = getStringValue(ds, kStudyInstanceUID);
    tags.seriesInstanceUid = getStringValue(ds, kSeriesInstanceUID);
    tags.sopInstanceUid = getStringValue(ds, kSOPInstanceUID);
    tags.patientId = getStringValue(ds, kPatientId);
    tags.modality = getStringValue(ds, kModality);
    return tags;
}

std::expected<DicomDataset, DicomErrorInfo>
GdcmDicomReader::readDataset(const std::filesystem::path& filePath) const
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            "File not found: " + filePath.string()
        });
    }

    gdcm::Reader reader;
    reader.SetFileName(filePath.string().c_str());

    bool ok = false;
    try {
        ok = reader.Read();
    } catch (const std::exception& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            std::string("Failed to read DICOM file: ") + e.what()
        });
    }
    if (!ok) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            "Failed to read DICOM file: " + filePath.string()
        });
    }

    const auto& ds = reader.GetFile().GetDataSet();

    DicomDataset dataset;
    dataset.path = filePath;

    try {
        dataset.rows = getUnsignedShort<0x0028, 0x0010>(ds);
        dataset.columns = getUnsignedShort<0x0028, 0x0011>(ds);
    } catch (const std::exception& e) {
        getLogger()->debug("Malformed image dimensions in {}: {}", filePath.string(), e.what());
    }

    auto thickness = getStringValue(ds, kSliceThickness);
    if (!thickness.empty()) {
        dataset.sliceThickness = thickness;
    }
    dataset.pixelSpacing = splitMultiValue(getStringValue(ds, kPixelSpacing));

    dataset.identity.sopClassUid = getStringValue(ds, kSOPClassUID);
    dataset.identity.studyInstanceUid = getStringValue(ds, kStudyInstanceUID);
    dataset.identity.seriesInstanceUid = getStringValue(ds, kSeriesInstanceUID);
    dataset.identity.sopInstanceUid = getStringValue(ds, kSOPInstanceUID);
    dataset.identity.patientId = getStringValue(ds, kPatientId);
    dataset.identity.modality = getStringValue(ds, kModality);

    dataset.hasPixelData = ds.FindDataElement(kPixelData)
        && !ds.GetDataElement(kPixelData).IsEmpty();

    if (dataset.hasPixelData) {
        dataset.pixels = decodePixels(filePath);
    }

    return dataset;
}

} // namespace acr_qa::core
