/// System/STL
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
/// Boost
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
/// glog
#include <glog/logging.h>

#include "textsynth/BackgroundPool.h"
#include "textsynth/Errors.h"

using namespace cimg_library;
namespace fs = boost::filesystem;

namespace TextSynth {

  namespace {

    void checkSize(int height, int width)
    {
      if (height < 1 or width < 1) {
        std::ostringstream oss;
        oss << "background size " << width << "x" << height
            << " must be positive";
        throw InvalidConfiguration(oss.str());
      }
    }

    bool isImageFile(const fs::path& path)
    {
      const std::string ext(boost::algorithm::to_lower_copy(
            path.extension().string()));
      return (ext == ".png" or ext == ".jpg" or ext == ".jpeg");
    }

    /// Image paths of a directory (sorted) or of a list file
    std::vector<std::string> collectImagePaths(const std::string& source)
    {
      std::vector<std::string> paths;
      if (fs::is_directory(source)) {
        for (fs::directory_iterator it(source), end; it != end; ++it) {
          if (fs::is_regular_file(it->path()) and isImageFile(it->path()))
            paths.push_back(it->path().string());
        }
        std::sort(paths.begin(), paths.end());
        return paths;
      }

      std::ifstream infile(source.c_str());
      if (infile.bad() or not infile.is_open())
        throw EmptyResourcePool("could not open background source "+source);
      std::string imagepath;
      while (std::getline(infile, imagepath)) {
        boost::algorithm::trim(imagepath);
        if (not imagepath.empty())
          paths.push_back(imagepath);
      }
      return paths;
    }

  }  // namespace


  BackgroundPool::BackgroundPool(const std::string& source,
                                 int height,
                                 int width,
                                 RNG::RandomSource& rng)
    : m_height(height), m_width(width), m_source(source)
  {
    checkSize(height, width);

    const std::vector<std::string> paths(collectImagePaths(source));
    for (std::size_t i = 0; i < paths.size(); ++i) {
      ImageU8 raw;
      try {
        raw.load(paths[i].c_str());
      } catch (const CImgException& e) {
        LOG(WARNING) << "Skipping unreadable background " << paths[i]
                     << ": " << e.what();
        continue;
      }
      if (raw.is_empty()) {
        LOG(WARNING) << "Skipping empty background " << paths[i];
        continue;
      }
      addImage(raw, rng);
    }
    checkNotEmpty();

    const std::size_t total_size{m_images.size() *
                                 static_cast<std::size_t>(m_width) *
                                 static_cast<std::size_t>(m_height)};
    LOG(INFO) << "Loaded " << m_images.size() << " backgrounds"
              << " from " << source
              << " with a total size of " << total_size/(1024*1024) << " MB.";
  }

  BackgroundPool::BackgroundPool(const std::vector<ImageU8>& images,
                                 int height,
                                 int width,
                                 RNG::RandomSource& rng)
    : m_height(height), m_width(width)
  {
    checkSize(height, width);
    for (std::size_t i = 0; i < images.size(); ++i) {
      if (not images[i].is_empty())
        addImage(images[i], rng);
    }
    checkNotEmpty();
  }

  void BackgroundPool::addImage(const ImageU8& image, RNG::RandomSource& rng)
  {
    /// Gray+alpha keeps its gray channel
    ImageU8 gray(image.spectrum() == 2 ? image.get_channel(0)
                                       : toGrayscale(image));

    const int origin_W = gray.width();
    const int origin_H = gray.height();
    if (origin_W < m_width or origin_H < m_height) {
      /// Match the target height; match the width instead if that is short
      const int width1 = static_cast<int>(std::ceil(
            static_cast<double>(origin_W) * m_height / origin_H));
      if (width1 >= m_width) {
        gray = resizeCubic(gray, width1, m_height);
      } else {
        const int height2 = static_cast<int>(std::ceil(
              static_cast<double>(origin_H) * m_width / origin_W));
        gray = resizeCubic(gray, m_width, std::max(m_height, height2));
      }
    }

    const int x = rng.uniformInt(0, gray.width() - m_width);
    const int y = rng.uniformInt(0, gray.height() - m_height);
    m_images.push_back(gray.get_crop(x, y, x+m_width-1, y+m_height-1));
  }

  void BackgroundPool::checkNotEmpty() const
  {
    if (m_images.empty()) {
      throw EmptyResourcePool("no usable background image"
                              +(m_source.empty() ? std::string()
                                                 : " in "+m_source));
    }
  }

  const ImageU8& BackgroundPool::random(RNG::RandomSource& rng) const
  {
    return m_images[rng.uniformInt(0, static_cast<int>(m_images.size())-1)];
  }

  const ImageU8& BackgroundPool::get(std::size_t index) const
  {
    if (index >= m_images.size()) {
      std::ostringstream oss;
      oss << "background index " << index << " out of range (pool holds "
          << m_images.size() << ")";
      throw std::out_of_range(oss.str());
    }
    return m_images[index];
  }

}  /// namespace TextSynth
