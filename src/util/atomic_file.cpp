#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <iterator>
#include <system_error>

namespace mostrix::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path,
                     const std::function<bool(std::ofstream&)>& writer,
                     std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      if (error) {
        *error = "failed to open temp file for write: " + tmp_path.string();
      }
      return false;
    }
    if (!writer(out)) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error && error->empty()) {
        *error = "writer failed";
      }
      return false;
    }
    out.flush();
    if (!out.good()) {
      out.close();
      RemoveQuietly(tmp_path);
      if (error) {
        *error = "flush failed";
      }
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    RemoveQuietly(tmp_path);
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    return false;
  }
  return true;
}

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  return AtomicWriteFile(
      path,
      [&](std::ofstream& out) -> bool {
        if (!data.empty()) {
          out.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        }
        return out.good();
      },
      error);
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) {
      *error = "failed to open file for read: " + path.string();
    }
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (error) {
      *error = "failed to read file: " + path.string();
    }
    return false;
  }
  return true;
}

}  // namespace mostrix::util
