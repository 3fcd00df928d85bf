#ifndef DOCINTEL_RASTER_LOADER_HPP
#define DOCINTEL_RASTER_LOADER_HPP

#include <opencv2/core.hpp>

#include <string>

namespace docintel {

/**
 * @brief Result of decoding a document file into a raster
 */
struct RasterLoadResult {
  bool success = false;
  std::string errorMessage;
  cv::Mat image;        ///< BGR or grayscale raster
  double knownDpi = 0.0; ///< Resolution when known (rendered PDFs), else 0
};

/**
 * @brief Decode an image or PDF file into a raster
 *
 * Image files are decoded with OpenCV. PDF files have their first page
 * rendered with Poppler at @p pdfDpi.
 *
 * @param path Path to the file
 * @param pdfDpi Render resolution for PDF input
 * @return RasterLoadResult; errorMessage explains a failure
 */
RasterLoadResult loadRaster(const std::string &path, double pdfDpi = 200.0);

/**
 * @brief Render the first page of a PDF with Poppler
 */
RasterLoadResult renderPdfFirstPage(const std::string &pdfPath, double dpi);

} // namespace docintel

#endif // DOCINTEL_RASTER_LOADER_HPP
