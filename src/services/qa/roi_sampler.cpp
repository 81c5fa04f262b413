#include "services/qa/roi_sampler.hpp"

#include <algorithm>
#include <cmath>

#include <itkImageRegionConstIterator.h>

namespace acr_qa::services {

RoiBounds RoiBounds::fromFractions(int rows, int columns,
                                   double rowStartFraction,
                                   double rowEndFraction,
                                   double colStartFraction,
                                   double colEndFraction) {
    return RoiBounds{
        static_cast<int>(rows * rowStartFraction),
        static_cast<int>(rows * rowEndFraction),
        static_cast<int>(columns * colStartFraction),
        static_cast<int>(columns * colEndFraction)
    };
}

RoiBounds RoiBounds::clampedTo(int rows, int columns) const {
    return RoiBounds{
        std::clamp(rowStart, 0, rows),
        std::clamp(rowEnd, 0, rows),
        std::clamp(colStart, 0, columns),
        std::clamp(colEnd, 0, columns)
    };
}

int64_t RoiBounds::pixelCount() const {
    if (rowEnd <= rowStart || colEnd <= colStart) {
        return 0;
    }
    return static_cast<int64_t>(rowEnd - rowStart) * (colEnd - colStart);
}

int RoiSampler::rowCount(const PixelImageType* image) {
    if (!image) {
        return 0;
    }
    return static_cast<int>(image->GetLargestPossibleRegion().GetSize()[1]);
}

int RoiSampler::columnCount(const PixelImageType* image) {
    if (!image) {
        return 0;
    }
    return static_cast<int>(image->GetLargestPossibleRegion().GetSize()[0]);
}

RegionStatistics RoiSampler::measure(const PixelImageType* image, const RoiBounds& roi) {
    RegionStatistics stats;
    if (!image) {
        return stats;
    }

    auto clamped = roi.clampedTo(rowCount(image), columnCount(image));
    if (clamped.isEmpty()) {
        return stats;
    }

    const auto origin = image->GetLargestPossibleRegion().GetIndex();

    PixelImageType::IndexType start;
    start[0] = origin[0] + clamped.colStart;
    start[1] = origin[1] + clamped.rowStart;

    PixelImageType::SizeType size;
    size[0] = static_cast<PixelImageType::SizeValueType>(clamped.colEnd - clamped.colStart);
    size[1] = static_cast<PixelImageType::SizeValueType>(clamped.rowEnd - clamped.rowStart);

    PixelImageType::RegionType region(start, size);

    // Two-pass population variance
    double sum = 0.0;
    int64_t count = 0;
    itk::ImageRegionConstIterator<PixelImageType> it(image, region);
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        sum += static_cast<double>(it.Get());
        ++count;
    }

    stats.pixelCount = count;
    stats.mean = sum / static_cast<double>(count);

    double sumSq = 0.0;
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        double d = static_cast<double>(it.Get()) - stats.mean;
        sumSq += d * d;
    }
    stats.stdDev = std::sqrt(sumSq / static_cast<double>(count));

    return stats;
}

std::vector<double> RoiSampler::rowProfile(const PixelImageType* image, int row) {
    std::vector<double> profile;
    const int rows = rowCount(image);
    const int columns = columnCount(image);
    if (row < 0 || row >= rows) {
        return profile;
    }

    const auto origin = image->GetLargestPossibleRegion().GetIndex();
    profile.reserve(static_cast<size_t>(columns));
    for (int x = 0; x < columns; ++x) {
        PixelImageType::IndexType idx;
        idx[0] = origin[0] + x;
        idx[1] = origin[1] + row;
        profile.push_back(static_cast<double>(image->GetPixel(idx)));
    }
    return profile;
}

std::vector<double> RoiSampler::columnProfile(const PixelImageType* image, int column) {
    std::vector<double> profile;
    const int rows = rowCount(image);
    const int columns = columnCount(image);
    if (column < 0 || column >= columns) {
        return profile;
    }

    const auto origin = image->GetLargestPossibleRegion().GetIndex();
    profile.reserve(static_cast<size_t>(rows));
    for (int y = 0; y < rows; ++y) {
        PixelImageType::IndexType idx;
        idx[0] = origin[0] + column;
        idx[1] = origin[1] + y;
        profile.push_back(static_cast<double>(image->GetPixel(idx)));
    }
    return profile;
}

} // namespace acr_qa::services
