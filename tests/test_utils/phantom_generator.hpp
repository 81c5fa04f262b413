#pragma once

/// @file phantom_generator.hpp
/// @brief Synthetic 2-D slices and datasets for QA metric tests
///
/// Produces deterministic float images shaped like the pixel arrays the
/// DICOM reader hands to the metrics engine.

#include <optional>
#include <string>
#include <vector>

#include <itkImage.h>
#include <itkImageRegionIterator.h>

#include "core/dicom_dataset.hpp"

namespace acr_qa::test_utils {

using core::PixelImageType;

/// Create a rows x columns slice filled with a constant value
inline PixelImageType::Pointer createUniformSlice(int rows, int columns,
                                                  float value = 100.0f) {
    auto image = PixelImageType::New();

    PixelImageType::SizeType size;
    size[0] = static_cast<PixelImageType::SizeValueType>(columns);
    size[1] = static_cast<PixelImageType::SizeValueType>(rows);

    PixelImageType::IndexType start;
    start.Fill(0);

    PixelImageType::RegionType region;
    region.SetSize(size);
    region.SetIndex(start);

    image->SetRegions(region);
    image->Allocate();
    image->FillBuffer(value);

    return image;
}

/// Set one pixel by (row, column)
inline void setPixel(PixelImageType* image, int row, int column, float value) {
    PixelImageType::IndexType index;
    index[0] = column;
    index[1] = row;
    image->SetPixel(index, value);
}

/// Slice whose value at (row, column) is row * columns + column
inline PixelImageType::Pointer createRampSlice(int rows, int columns) {
    auto image = createUniformSlice(rows, columns, 0.0f);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < columns; ++c) {
            setPixel(image, r, c, static_cast<float>(r * columns + c));
        }
    }
    return image;
}

/// Slice with a uniform disc on a zero background, like an axial phantom slice
inline PixelImageType::Pointer createDiscSlice(int size, float inside = 1000.0f) {
    auto image = createUniformSlice(size, size, 0.0f);
    const double center = (size - 1) / 2.0;
    const double radius = size * 0.42;

    itk::ImageRegionIterator<PixelImageType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto index = it.GetIndex();
        const double dx = index[0] - center;
        const double dy = index[1] - center;
        if (dx * dx + dy * dy <= radius * radius) {
            it.Set(inside);
        }
    }
    return image;
}

/// Dataset with shape tags, spacing and thickness set and a decoded slice
inline core::DicomDataset createDataset(PixelImageType::Pointer pixels,
                                        std::vector<std::string> pixelSpacing = {"1.0", "1.0"},
                                        std::optional<std::string> sliceThickness = "5.0",
                                        std::string path = "slice.dcm") {
    core::DicomDataset ds;
    ds.path = std::move(path);
    ds.hasPixelData = true;
    ds.pixels = pixels;
    if (pixels) {
        const auto size = pixels->GetLargestPossibleRegion().GetSize();
        ds.rows = static_cast<int>(size[1]);
        ds.columns = static_cast<int>(size[0]);
    }
    ds.pixelSpacing = std::move(pixelSpacing);
    ds.sliceThickness = std::move(sliceThickness);
    ds.identity.modality = "MR";
    ds.identity.sopClassUid = "1.2.840.10008.5.1.4.1.1.4";
    return ds;
}

} // namespace acr_qa::test_utils
