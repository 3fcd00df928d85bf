#include "RasterLoader.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>

namespace docintel {

namespace {

bool hasPdfExtension(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".pdf";
}

} // namespace

RasterLoadResult loadRaster(const std::string &path, double pdfDpi) {
  RasterLoadResult result;

  if (!std::filesystem::exists(path)) {
    result.errorMessage = "File not found: " + path;
    return result;
  }

  if (hasPdfExtension(path)) {
    return renderPdfFirstPage(path, pdfDpi);
  }

  result.image = cv::imread(path, cv::IMREAD_COLOR);
  if (result.image.empty()) {
    result.errorMessage = "Failed to load image: " + path;
    return result;
  }

  result.success = true;
  return result;
}

RasterLoadResult renderPdfFirstPage(const std::string &pdfPath, double dpi) {
  RasterLoadResult result;

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    if (doc->pages() < 1) {
      result.errorMessage = "PDF has no pages";
      return result;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    std::unique_ptr<poppler::page> page(doc->create_page(0));
    if (!page) {
      result.errorMessage = "Failed to create first page";
      return result;
    }

    poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
    if (!rendered.is_valid()) {
      result.errorMessage = "Failed to render first page";
      return result;
    }

    const int width = rendered.width();
    const int height = rendered.height();
    char *data = const_cast<char *>(rendered.const_data());

    switch (rendered.format()) {
    case poppler::image::format_argb32: {
      // ARGB32 is stored as BGRA in memory on little-endian hosts
      cv::Mat bgra(height, width, CV_8UC4, data, rendered.bytes_per_row());
      cv::cvtColor(bgra, result.image, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      cv::Mat rgb(height, width, CV_8UC3, data, rendered.bytes_per_row());
      cv::cvtColor(rgb, result.image, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24:
      result.image =
          cv::Mat(height, width, CV_8UC3, data, rendered.bytes_per_row())
              .clone();
      break;
    case poppler::image::format_gray8:
      result.image =
          cv::Mat(height, width, CV_8UC1, data, rendered.bytes_per_row())
              .clone();
      break;
    default:
      result.errorMessage = "Unsupported image format";
      return result;
    }

    result.knownDpi = dpi;
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF render failed: ") + e.what();
  }

  return result;
}

} // namespace docintel
