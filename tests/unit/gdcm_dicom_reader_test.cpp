#include "core/dicom_detector.hpp"
#include "core/dicom_reader.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include <gdcmAttribute.h>
#include <gdcmDataElement.h>
#include <gdcmDataSet.h>
#include <gdcmFile.h>
#include <gdcmTag.h>
#include <gdcmUIDGenerator.h>
#include <gdcmVR.h>
#include <gdcmWriter.h>

#include <itkImageRegionConstIterator.h>

#include "test_utils/upload_builder.hpp"

namespace acr_qa::core::test {

using test_utils::TempDirectory;

// =============================================================================
// Synthetic DICOM construction
// =============================================================================

namespace {

namespace tags {
const gdcm::Tag SOPClassUID{0x0008, 0x0016};
const gdcm::Tag SOPInstanceUID{0x0008, 0x0018};
const gdcm::Tag Modality{0x0008, 0x0060};
const gdcm::Tag PatientID{0x0010, 0x0020};
const gdcm::Tag SliceThickness{0x0018, 0x0050};
const gdcm::Tag StudyInstanceUID{0x0020, 0x000d};
const gdcm::Tag SeriesInstanceUID{0x0020, 0x000e};
const gdcm::Tag PhotometricInterpretation{0x0028, 0x0004};
const gdcm::Tag PixelSpacing{0x0028, 0x0030};
const gdcm::Tag RescaleIntercept{0x0028, 0x1052};
const gdcm::Tag RescaleSlope{0x0028, 0x1053};
const gdcm::Tag PixelData{0x7FE0, 0x0010};
const gdcm::Tag MediaStorageSOPClassUID{0x0002, 0x0002};
const gdcm::Tag MediaStorageSOPInstanceUID{0x0002, 0x0003};
const gdcm::Tag TransferSyntaxUID{0x0002, 0x0010};
}  // namespace tags

constexpr const char* kMRImageStorage = "1.2.840.10008.5.1.4.1.1.4";
constexpr const char* kCTImageStorage = "1.2.840.10008.5.1.4.1.1.2";
constexpr const char* kSecondaryCapture = "1.2.840.10008.5.1.4.1.1.7";

void insertStringElement(gdcm::DataSet& ds, const gdcm::Tag& tag,
                         const gdcm::VR& vr, std::string value) {
    if (value.size() % 2 != 0) {
        value.push_back(vr == gdcm::VR::UI ? '\0' : ' ');
    }
    gdcm::DataElement de(tag);
    de.SetVR(vr);
    de.SetByteValue(value.c_str(), static_cast<uint32_t>(value.size()));
    ds.Insert(de);
}

template <uint16_t Group, uint16_t Element>
void insertUnsignedShort(gdcm::DataSet& ds, uint16_t value) {
    gdcm::Attribute<Group, Element> attribute;
    attribute.SetValue(value);
    ds.Insert(attribute.GetAsDataElement());
}

struct SliceFixture {
    std::string sopClass = kMRImageStorage;
    std::string patientId = "ACR-PHANTOM";
    std::string modality = "MR";
    bool withIdentity = true;
    bool withPixelData = true;
    uint16_t rows = 4;
    uint16_t columns = 6;
    uint16_t samplesPerPixel = 1;
    uint16_t storedValue = 100;
    std::string rescaleIntercept;
    std::string rescaleSlope;
};

}  // anonymous namespace

// =============================================================================
// Test fixture
// =============================================================================

class GdcmDicomReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_ = std::make_unique<TempDirectory>("acr_qa_gdcm_reader_test");
    }

    void TearDown() override {
        scratch_.reset();
    }

    /// Write a Part 10 file with preamble and Explicit VR Little Endian meta
    std::filesystem::path writeSlice(const std::string& filename, const SliceFixture& fixture) {
        auto path = scratch_->path() / filename;

        gdcm::Writer writer;
        writer.SetFileName(path.string().c_str());
        // Meta filling derives from SOP Class/Instance UID, absent in identity-less fixtures
        writer.SetCheckFileMetaInformation(fixture.withIdentity);
        auto& file = writer.GetFile();
        auto& ds = file.GetDataSet();

        gdcm::UIDGenerator uidGen;
        std::string instanceUid = uidGen.Generate();

        if (fixture.withIdentity) {
            insertStringElement(ds, tags::SOPClassUID, gdcm::VR::UI, fixture.sopClass);
            insertStringElement(ds, tags::SOPInstanceUID, gdcm::VR::UI, instanceUid);
            insertStringElement(ds, tags::Modality, gdcm::VR::CS, fixture.modality);
            insertStringElement(ds, tags::StudyInstanceUID, gdcm::VR::UI, uidGen.Generate());
            insertStringElement(ds, tags::SeriesInstanceUID, gdcm::VR::UI, uidGen.Generate());
        }
        if (!fixture.patientId.empty()) {
            insertStringElement(ds, tags::PatientID, gdcm::VR::LO, fixture.patientId);
        }

        insertStringElement(ds, tags::SliceThickness, gdcm::VR::DS, "5");
        insertStringElement(ds, tags::PixelSpacing, gdcm::VR::DS, "0.9375\\0.9766");

        insertUnsignedShort<0x0028, 0x0002>(ds, fixture.samplesPerPixel);
        insertUnsignedShort<0x0028, 0x0010>(ds, fixture.rows);
        insertUnsignedShort<0x0028, 0x0011>(ds, fixture.columns);

        size_t pixelCount = static_cast<size_t>(fixture.rows) * fixture.columns;
        if (fixture.samplesPerPixel == 1) {
            insertStringElement(ds, tags::PhotometricInterpretation, gdcm::VR::CS, "MONOCHROME2");
            insertUnsignedShort<0x0028, 0x0100>(ds, 16);
            insertUnsignedShort<0x0028, 0x0101>(ds, 16);
            insertUnsignedShort<0x0028, 0x0102>(ds, 15);
            insertUnsignedShort<0x0028, 0x0103>(ds, 0);
        } else {
            insertStringElement(ds, tags::PhotometricInterpretation, gdcm::VR::CS, "RGB");
            insertUnsignedShort<0x0028, 0x0006>(ds, 0);
            insertUnsignedShort<0x0028, 0x0100>(ds, 8);
            insertUnsignedShort<0x0028, 0x0101>(ds, 8);
            insertUnsignedShort<0x0028, 0x0102>(ds, 7);
            insertUnsignedShort<0x0028, 0x0103>(ds, 0);
        }

        if (!fixture.rescaleIntercept.empty()) {
            insertStringElement(ds, tags::RescaleIntercept, gdcm::VR::DS, fixture.rescaleIntercept);
        }
        if (!fixture.rescaleSlope.empty()) {
            insertStringElement(ds, tags::RescaleSlope, gdcm::VR::DS, fixture.rescaleSlope);
        }

        if (fixture.withPixelData) {
            gdcm::DataElement pixelData(tags::PixelData);
            if (fixture.samplesPerPixel == 1) {
                std::vector<uint16_t> buffer(pixelCount, fixture.storedValue);
                pixelData.SetVR(gdcm::VR::OW);
                pixelData.SetByteValue(reinterpret_cast<const char*>(buffer.data()),
                                       static_cast<uint32_t>(buffer.size() * sizeof(uint16_t)));
            } else {
                std::vector<uint8_t> buffer(pixelCount * fixture.samplesPerPixel, 90);
                pixelData.SetVR(gdcm::VR::OB);
                pixelData.SetByteValue(reinterpret_cast<const char*>(buffer.data()),
                                       static_cast<uint32_t>(buffer.size()));
            }
            ds.Insert(pixelData);
        }

        auto& header = file.GetHeader();
        std::string metaSopClass = fixture.withIdentity ? fixture.sopClass : kSecondaryCapture;
        insertStringElement(header, tags::MediaStorageSOPClassUID, gdcm::VR::UI, metaSopClass);
        insertStringElement(header, tags::MediaStorageSOPInstanceUID, gdcm::VR::UI, instanceUid);
        insertStringElement(header, tags::TransferSyntaxUID, gdcm::VR::UI, "1.2.840.10008.1.2.1");

        EXPECT_TRUE(writer.Write()) << "failed to write " << path.string();
        return path;
    }

    /// Bare Implicit VR Little Endian data set: no preamble, no meta group
    std::filesystem::path writeBareSopClass(const std::string& filename) {
        std::string uid = kMRImageStorage;
        if (uid.size() % 2 != 0) {
            uid.push_back('\0');
        }

        std::vector<uint8_t> bytes = {0x08, 0x00, 0x16, 0x00};
        auto length = static_cast<uint32_t>(uid.size());
        for (int i = 0; i < 4; ++i) {
            bytes.push_back(static_cast<uint8_t>((length >> (8 * i)) & 0xFF));
        }
        bytes.insert(bytes.end(), uid.begin(), uid.end());

        auto path = scratch_->path() / filename;
        test_utils::writeBytes(path, bytes);
        return path;
    }

    static std::vector<float> pixelValues(const PixelImageType::Pointer& image) {
        std::vector<float> values;
        itk::ImageRegionConstIterator<PixelImageType> it(image, image->GetLargestPossibleRegion());
        for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
            values.push_back(it.Get());
        }
        return values;
    }

    std::unique_ptr<TempDirectory> scratch_;
    GdcmDicomReader reader_;
};

// =============================================================================
// Identifying tags
// =============================================================================

TEST_F(GdcmDicomReaderTest, ReadsIdentifyingTagsFromPart10File) {
    auto path = writeSlice("slice.dcm", SliceFixture{});

    auto result = reader_.readIdentifyingTags(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->sopClassUid, kMRImageStorage);
    EXPECT_EQ(result->modality, "MR");
    EXPECT_EQ(result->patientId, "ACR-PHANTOM");
    EXPECT_FALSE(result->sopInstanceUid.empty());
    EXPECT_FALSE(result->studyInstanceUid.empty());
    EXPECT_FALSE(result->seriesInstanceUid.empty());
    EXPECT_TRUE(result->identifiesDicom());
}

TEST_F(GdcmDicomReaderTest, ReadsSopClassWithoutPreamble) {
    auto path = writeBareSopClass("IM0001");

    auto result = reader_.readIdentifyingTags(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->sopClassUid, kMRImageStorage);
    EXPECT_TRUE(result->patientId.empty());
    EXPECT_TRUE(result->identifiesDicom());
}

TEST_F(GdcmDicomReaderTest, PatientIdAloneDoesNotIdentify) {
    SliceFixture fixture;
    fixture.withIdentity = false;
    fixture.withPixelData = false;
    auto path = writeSlice("patient_only.dcm", fixture);

    auto result = reader_.readIdentifyingTags(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->patientId, "ACR-PHANTOM");
    EXPECT_TRUE(result->sopClassUid.empty());
    EXPECT_TRUE(result->modality.empty());
    EXPECT_FALSE(result->identifiesDicom());
}

TEST_F(GdcmDicomReaderTest, TextFileCarriesNoIdentity) {
    auto path = scratch_->path() / "notes.txt";
    test_utils::writeText(path, "scanner notes: phantom positioned, coil 8ch\n");

    auto result = reader_.readIdentifyingTags(path);
    EXPECT_TRUE(!result.has_value() || !result->identifiesDicom());
}

// =============================================================================
// Full data set
// =============================================================================

TEST_F(GdcmDicomReaderTest, ReadsGeometryAndSpacing) {
    auto path = writeSlice("slice.dcm", SliceFixture{});

    auto dataset = reader_.readDataset(path);
    ASSERT_TRUE(dataset.has_value()) << dataset.error().message;
    ASSERT_TRUE(dataset->rows.has_value());
    ASSERT_TRUE(dataset->columns.has_value());
    EXPECT_EQ(*dataset->rows, 4);
    EXPECT_EQ(*dataset->columns, 6);
    ASSERT_TRUE(dataset->sliceThickness.has_value());
    EXPECT_EQ(*dataset->sliceThickness, "5");
    EXPECT_EQ(dataset->pixelSpacing, (std::vector<std::string>{"0.9375", "0.9766"}));
    EXPECT_EQ(dataset->identity.sopClassUid, kMRImageStorage);
    EXPECT_TRUE(dataset->hasPixelData);
}

TEST_F(GdcmDicomReaderTest, DecodesStoredPixelValues) {
    auto path = writeSlice("slice.dcm", SliceFixture{});

    auto dataset = reader_.readDataset(path);
    ASSERT_TRUE(dataset.has_value()) << dataset.error().message;
    ASSERT_TRUE(dataset->hasPixelArray());

    auto size = dataset->pixels->GetLargestPossibleRegion().GetSize();
    EXPECT_EQ(size[0], 6u);
    EXPECT_EQ(size[1], 4u);
    for (float value : pixelValues(dataset->pixels)) {
        EXPECT_FLOAT_EQ(value, 100.0f);
    }
}

TEST_F(GdcmDicomReaderTest, RescaleIsNotAppliedToMetricInput) {
    SliceFixture fixture;
    fixture.sopClass = kCTImageStorage;
    fixture.modality = "CT";
    fixture.rescaleIntercept = "-1024";
    fixture.rescaleSlope = "2";
    auto path = writeSlice("rescaled.dcm", fixture);

    auto dataset = reader_.readDataset(path);
    ASSERT_TRUE(dataset.has_value()) << dataset.error().message;
    ASSERT_TRUE(dataset->hasPixelArray());
    for (float value : pixelValues(dataset->pixels)) {
        EXPECT_FLOAT_EQ(value, 100.0f);
    }
}

TEST_F(GdcmDicomReaderTest, ColourImageHasNoPixelArray) {
    SliceFixture fixture;
    fixture.sopClass = kSecondaryCapture;
    fixture.modality = "OT";
    fixture.samplesPerPixel = 3;
    auto path = writeSlice("colour.dcm", fixture);

    auto dataset = reader_.readDataset(path);
    ASSERT_TRUE(dataset.has_value()) << dataset.error().message;
    EXPECT_TRUE(dataset->hasPixelData);
    EXPECT_FALSE(dataset->hasPixelArray());
}

TEST_F(GdcmDicomReaderTest, MissingPixelDataIsFlagged) {
    SliceFixture fixture;
    fixture.withPixelData = false;
    auto path = writeSlice("no_pixels.dcm", fixture);

    auto dataset = reader_.readDataset(path);
    ASSERT_TRUE(dataset.has_value()) << dataset.error().message;
    EXPECT_FALSE(dataset->hasPixelData);
    EXPECT_FALSE(dataset->hasPixelArray());
    EXPECT_EQ(dataset->identity.modality, "MR");
}

TEST_F(GdcmDicomReaderTest, MissingFileIsNotFound) {
    auto dataset = reader_.readDataset(scratch_->path() / "absent.dcm");
    ASSERT_FALSE(dataset.has_value());
    EXPECT_EQ(dataset.error().code, DicomError::FileNotFound);
}

TEST_F(GdcmDicomReaderTest, TextFileYieldsNoPixelData) {
    auto path = scratch_->path() / "notes.txt";
    test_utils::writeText(path, "scanner notes: phantom positioned, coil 8ch\n");

    auto dataset = reader_.readDataset(path);
    EXPECT_TRUE(!dataset.has_value() || !dataset->hasPixelData);
}

// =============================================================================
// Detection with the production reader
// =============================================================================

TEST_F(GdcmDicomReaderTest, DetectorUsesTagStageForBareDataSet) {
    auto bare = writeBareSopClass("IM0002");
    auto part10 = writeSlice("slice.dcm", SliceFixture{});

    DicomDetector detector(std::make_shared<GdcmDicomReader>());

    auto bareResult = detector.classify(bare);
    EXPECT_TRUE(bareResult.isDicom());
    EXPECT_EQ(bareResult.stage, DetectionStage::IdentifyingTags);

    auto part10Result = detector.classify(part10);
    EXPECT_TRUE(part10Result.isDicom());
    EXPECT_EQ(part10Result.stage, DetectionStage::MagicHeader);
}

}  // namespace acr_qa::core::test
