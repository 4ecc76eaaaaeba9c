#include "TarReader.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/errors/Errors.hpp"

namespace rpub {

namespace fs = std::filesystem;

namespace {

constexpr size_t kBlock = 512;
using Header = std::array<char, kBlock>;

std::string field(const Header& h, size_t off, size_t len) {
  const char* p = h.data() + off;
  return std::string(p, strnlen(p, len));
}

uint64_t octal(const Header& h, size_t off, size_t len) {
  uint64_t v = 0;
  for (size_t i = off; i < off + len; ++i) {
    const char c = h[i];
    if (c == ' ' || c == '\0') {
      if (v != 0) break;
      continue;
    }
    if (c < '0' || c > '7') throw CorruptDataError("bad octal field in tar header");
    v = v * 8 + static_cast<uint64_t>(c - '0');
  }
  return v;
}

bool isZeroBlock(const Header& h) {
  return std::all_of(h.begin(), h.end(), [](char c) { return c == 0; });
}

void verifyChecksum(const Header& h) {
  const uint64_t stored = octal(h, 148, 8);
  uint64_t sum = 0;
  for (size_t i = 0; i < kBlock; ++i) {
    sum += (i >= 148 && i < 156) ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(h[i]);
  }
  if (sum != stored) throw CorruptDataError("tar header checksum mismatch");
}

uint64_t padded(uint64_t size) {
  return size + (kBlock - size % kBlock) % kBlock;
}

// The header's size field is untrusted: a member may not claim more bytes
// than are left in the archive.
void checkSize(std::ifstream& in, uint64_t archive_size, uint64_t size) {
  const std::streamoff pos = in.tellg();
  if (pos < 0) throw CorruptDataError("tar stream position lost");
  const uint64_t left = archive_size - std::min<uint64_t>(archive_size, static_cast<uint64_t>(pos));
  if (size > left) {
    throw CorruptDataError("tar member claims " + std::to_string(size) + " bytes but only " +
                           std::to_string(left) + " remain");
  }
}

std::string readPayload(std::ifstream& in, uint64_t archive_size, uint64_t size) {
  checkSize(in, archive_size, size);
  std::string data(size, '\0');
  if (size > 0 && !in.read(&data[0], static_cast<std::streamsize>(size))) {
    throw CorruptDataError("tar member truncated");
  }
  in.ignore(static_cast<std::streamsize>(padded(size) - size));
  return data;
}

} // namespace

std::vector<std::string> extractTar(const std::string& tar_path,
                                    const std::string& target_dir,
                                    const std::function<bool(const std::string&)>& accept) {
  std::ifstream in(tar_path, std::ios::binary);
  if (!in) throw FilesystemError("cannot open archive " + tar_path);

  std::error_code ec;
  const uint64_t archive_size = fs::file_size(tar_path, ec);
  if (ec) throw FilesystemError("cannot stat archive " + tar_path + ": " + ec.message());
  fs::create_directories(target_dir, ec);
  if (ec) throw FilesystemError("cannot create " + target_dir + ": " + ec.message());

  std::vector<std::string> written;
  std::string long_name;
  Header h{};
  for (;;) {
    if (!in.read(h.data(), kBlock)) {
      if (in.gcount() == 0) break; // archive without end marker
      throw CorruptDataError("tar header truncated in " + tar_path);
    }
    if (isZeroBlock(h)) break;
    verifyChecksum(h);

    const char type = h[156];
    const uint64_t size = octal(h, 124, 12);

    if (type == 'L') { // GNU long name for the next member
      long_name = readPayload(in, archive_size, size);
      long_name.erase(std::find(long_name.begin(), long_name.end(), '\0'), long_name.end());
      continue;
    }

    std::string name = long_name;
    long_name.clear();
    if (name.empty()) {
      name = field(h, 0, 100);
      const std::string prefix = field(h, 345, 155);
      if (std::memcmp(h.data() + 257, "ustar", 5) == 0 && !prefix.empty()) name = prefix + "/" + name;
    }

    if (type != '0' && type != '\0') {
      // directories, links, pax headers
      checkSize(in, archive_size, size);
      in.ignore(static_cast<std::streamsize>(padded(size)));
      continue;
    }

    const std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == ".." || !accept(base)) {
      checkSize(in, archive_size, size);
      in.ignore(static_cast<std::streamsize>(padded(size)));
      continue;
    }

    const std::string data = readPayload(in, archive_size, size);
    const fs::path dest = fs::path(target_dir) / base;
    const fs::path tmp = dest.string() + ".part";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out) throw FilesystemError("cannot write " + tmp.string());
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      if (!out) throw FilesystemError("write failed for " + tmp.string());
    }
    fs::rename(tmp, dest, ec);
    if (ec) throw FilesystemError("cannot move " + tmp.string() + ": " + ec.message());
    written.push_back(dest.string());
  }

  spdlog::debug("extracted {} member(s) from {}", written.size(), tar_path);
  return written;
}

} // namespace rpub
