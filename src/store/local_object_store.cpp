#include "store/local_object_store.hpp"
#include "crypto/digest.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>
#include <boost/log/trivial.hpp>

namespace s3sync {
namespace store {

namespace fs = std::filesystem;

namespace {

constexpr const char* DEFAULT_ACL = "private";

// Maps a filesystem failure onto the store error taxonomy
[[noreturn]] void rethrow_filesystem_error(const fs::filesystem_error& e, const std::string& context) {
  if (e.code() == std::errc::permission_denied || e.code() == std::errc::operation_not_permitted) {
    throw AccessDenied(context + ": " + e.code().message());
  }
  throw StoreError(context + ": " + e.what());
}

std::string strip_quotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

fs::path with_suffix(const fs::path& path, const char* suffix) {
  fs::path result = path;
  result += suffix;
  return result;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalObjectStore::LocalObjectStore(const config::SyncConfig& config)
  : bucket_(config.bucket)
  , root_(fs::path(config.store_root) / config.bucket)
  , multipart_threshold_(config.multipart_threshold)
  , part_size_(config.part_size)
  , max_part_workers_(config.max_part_workers) {
  config.validate();
  BOOST_LOG_TRIVIAL(info) << "Local store: Opening bucket " << bucket_ << " at: " << root_.string();

  try {
    check_directory_exists(root_);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to create bucket directory: " << e.what();
    rethrow_filesystem_error(e, "Failed to open bucket " + bucket_);
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<ObjectInfo> LocalObjectStore::head(const std::string& key, const CallContext& ctx) {
  ctx.check("head " + key);
  validate_key(key);

  auto metadata = read_metadata(metadata_path(key));
  if (!metadata) {
    BOOST_LOG_TRIVIAL(debug) << "Local store: Key not found: " << key;
    return std::nullopt;
  }

  if (metadata->info.key != key) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Metadata for " << key << " belongs to " << metadata->info.key;
    throw StoreError("Corrupt metadata for key: " + key);
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Found key " << key << " (" << metadata->info.content_length
                           << " bytes, etag " << metadata->info.etag << ")";
  return metadata->info;
}

std::vector<ObjectInfo> LocalObjectStore::list(const std::string& prefix, const CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Listing bucket " << bucket_ << " with prefix: '" << prefix << "'";
  ctx.check("list " + prefix);

  std::vector<ObjectInfo> objects;
  try {
    for (const auto& entry : fs::recursive_directory_iterator(root_)) {
      if (!entry.is_regular_file() || entry.path().extension() != ".meta") {
        continue;
      }
      ctx.check("list " + prefix);

      auto metadata = read_metadata(entry.path());
      if (metadata && metadata->info.key.compare(0, prefix.size(), prefix) == 0) {
        objects.push_back(metadata->info);
      }
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Listing failed: " << e.what();
    rethrow_filesystem_error(e, "Failed to list bucket " + bucket_);
  }

  // Match the key order of a remote listing
  std::sort(objects.begin(), objects.end(),
            [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });

  BOOST_LOG_TRIVIAL(info) << "Local store: Listed " << objects.size() << " objects";
  return objects;
}

TransferOptions LocalObjectStore::options_of(const std::string& key) const {
  validate_key(key);
  auto metadata = read_metadata(metadata_path(key));
  if (!metadata) {
    throw ObjectNotFound(key);
  }
  return metadata->options;
}


//==============================================
// MUTATING OPERATIONS
//==============================================

void LocalObjectStore::copy(const std::string& src_key, const std::string& dst_key,
                            const TransferOptions& options, const CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Copying " << src_key << " to " << dst_key;
  ctx.check("copy " + src_key);
  validate_key(src_key);
  validate_key(dst_key);

  auto source = read_metadata(metadata_path(src_key));
  if (!source) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Copy source not found: " << src_key;
    throw ObjectNotFound(src_key);
  }

  fs::path dst_path = object_path(dst_key);
  fs::path tmp_path = with_suffix(dst_path, ".tmp");
  try {
    check_directory_exists(dst_path.parent_path());
    fs::copy_file(object_path(src_key), tmp_path, fs::copy_options::overwrite_existing);
    fs::rename(tmp_path, dst_path);
  } catch (const fs::filesystem_error& e) {
    std::error_code ec;
    fs::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Local store: Copy failed: " << e.what();
    rethrow_filesystem_error(e, "Failed to copy " + src_key + " to " + dst_key);
  }

  // The copy carries the source content fingerprint and gets its own ACL
  Metadata copied = *source;
  copied.info.key = dst_key;
  copied.options.acl = options.acl.empty() ? DEFAULT_ACL : options.acl;
  if (!options.server_side_encryption.empty()) {
    copied.options.server_side_encryption = options.server_side_encryption;
  }
  write_metadata(dst_key, copied);

  BOOST_LOG_TRIVIAL(info) << "Local store: Copied " << src_key << " to " << dst_key
                          << " with ACL " << copied.options.acl;
}

void LocalObjectStore::remove(const std::string& key, const CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Removing key: " << key;
  ctx.check("delete " + key);
  validate_key(key);

  fs::path data_path = object_path(key);
  try {
    // Metadata goes first so a half-removed object reads as absent
    bool existed = fs::remove(metadata_path(key));
    fs::remove(data_path);
    prune_empty_directories(data_path.parent_path());

    if (existed) {
      BOOST_LOG_TRIVIAL(info) << "Local store: Successfully removed key: " << key;
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Local store: Key was already absent: " << key;
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to remove key " << key << ": " << e.what();
    rethrow_filesystem_error(e, "Failed to delete " + key);
  }
}


//==============================================
// TRANSFERS
//==============================================

void LocalObjectStore::upload(const fs::path& local_path, const std::string& key,
                              const TransferOptions& options, const ProgressCallback& progress,
                              const CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Uploading " << local_path.string() << " as " << key;
  ctx.check("upload " + key);
  validate_key(key);

  std::error_code ec;
  if (!fs::is_regular_file(local_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Upload source is not a regular file: " << local_path.string();
    throw StoreError("Upload source is not a regular file: " + local_path.string());
  }

  fs::path dst_path = object_path(key);
  fs::path tmp_path = with_suffix(dst_path, ".tmp");
  std::uintmax_t size = 0;
  std::string etag;

  try {
    size = fs::file_size(local_path);
    check_directory_exists(dst_path.parent_path());

    if (size >= multipart_threshold_ && size > part_size_) {
      etag = write_multipart(local_path, tmp_path, size, progress, ctx);
    } else {
      etag = write_single_part(local_path, tmp_path, progress, ctx);
    }
    fs::rename(tmp_path, dst_path);
  } catch (const fs::filesystem_error& e) {
    fs::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Local store: Upload of " << key << " failed: " << e.what();
    rethrow_filesystem_error(e, "Failed to upload " + key);
  } catch (const std::exception& e) {
    fs::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Local store: Upload of " << key << " failed: " << e.what();
    throw;
  }

  Metadata metadata;
  metadata.info = ObjectInfo{bucket_, key, size, "\"" + etag + "\""};
  metadata.options = options;
  if (metadata.options.acl.empty()) {
    metadata.options.acl = DEFAULT_ACL;
  }
  write_metadata(key, metadata);

  BOOST_LOG_TRIVIAL(info) << "Local store: Successfully uploaded " << size << " bytes as " << key
                          << " (etag " << etag << ")";
}

void LocalObjectStore::download(const std::string& key, const fs::path& local_path,
                                const ProgressCallback& progress, const CallContext& ctx) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Downloading " << key << " to " << local_path.string();
  ctx.check("download " + key);
  validate_key(key);

  auto metadata = read_metadata(metadata_path(key));
  if (!metadata) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Download source not found: " << key;
    throw ObjectNotFound(key);
  }

  fs::path tmp_path = with_suffix(local_path, ".s3sync.tmp");
  std::error_code ec;
  try {
    std::string md5 = write_single_part(object_path(key), tmp_path, progress, ctx);

    // Single part objects carry their MD5 as the ETag
    std::string expected = strip_quotes(metadata->info.etag);
    if (expected.find('-') == std::string::npos && expected != md5) {
      throw StoreError("Checksum mismatch while downloading " + key);
    }
    fs::rename(tmp_path, local_path);
  } catch (const fs::filesystem_error& e) {
    fs::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Local store: Download of " << key << " failed: " << e.what();
    rethrow_filesystem_error(e, "Failed to download " + key);
  } catch (const std::exception& e) {
    fs::remove(tmp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Local store: Download of " << key << " failed: " << e.what();
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Local store: Successfully downloaded " << key;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

fs::path LocalObjectStore::object_path(const std::string& key) const {
  std::string hash = crypto::sha256_hex(key);
  fs::path path = root_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

fs::path LocalObjectStore::metadata_path(const std::string& key) const {
  return with_suffix(object_path(key), ".meta");
}

void LocalObjectStore::validate_key(const std::string& key) const {
  if (key.empty()) {
    throw StoreError("Object key must not be empty");
  }
  if (key.find('\n') != std::string::npos) {
    throw StoreError("Object key must not contain a newline");
  }
}


//==============================================
// METADATA
//==============================================

std::optional<LocalObjectStore::Metadata> LocalObjectStore::read_metadata(const fs::path& meta_path) const {
  std::error_code ec;
  bool exists = fs::exists(meta_path, ec);
  if (ec) {
    if (ec == std::errc::permission_denied) {
      throw AccessDenied("cannot stat " + meta_path.string());
    }
    throw StoreError("Failed to stat " + meta_path.string() + ": " + ec.message());
  }
  if (!exists) {
    return std::nullopt;
  }

  std::ifstream file(meta_path);
  if (!file) {
    throw AccessDenied("cannot read " + meta_path.string());
  }

  Metadata metadata;
  metadata.info.bucket = bucket_;
  std::string line;
  try {
    while (std::getline(file, line)) {
      auto separator = line.find('=');
      if (separator == std::string::npos) {
        continue;
      }
      std::string name = line.substr(0, separator);
      std::string value = line.substr(separator + 1);

      if (name == "key") {
        metadata.info.key = value;
      } else if (name == "etag") {
        metadata.info.etag = value;
      } else if (name == "length") {
        metadata.info.content_length = std::stoull(value);
      } else if (name == "acl") {
        metadata.options.acl = value;
      } else if (name == "sse") {
        metadata.options.server_side_encryption = value;
      }
    }
  } catch (const std::logic_error& e) {
    throw StoreError("Corrupt metadata in " + meta_path.string() + ": " + e.what());
  }

  if (metadata.info.key.empty()) {
    throw StoreError("Corrupt metadata in " + meta_path.string() + ": missing key");
  }
  return metadata;
}

void LocalObjectStore::write_metadata(const std::string& key, const Metadata& metadata) const {
  fs::path meta_path = metadata_path(key);
  fs::path tmp_path = with_suffix(meta_path, ".tmp");

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      throw StoreError("Failed to write metadata for " + key);
    }
    file << "etag=" << metadata.info.etag << '\n'
         << "length=" << metadata.info.content_length << '\n'
         << "acl=" << metadata.options.acl << '\n'
         << "sse=" << metadata.options.server_side_encryption << '\n'
         << "key=" << metadata.info.key << '\n';
    if (!file.flush()) {
      throw StoreError("Failed to flush metadata for " + key);
    }
  }

  try {
    fs::rename(tmp_path, meta_path);
  } catch (const fs::filesystem_error& e) {
    std::error_code ec;
    fs::remove(tmp_path, ec);
    rethrow_filesystem_error(e, "Failed to commit metadata for " + key);
  }
}


//==============================================
// TRANSFER SUPPORT
//==============================================

std::string LocalObjectStore::write_single_part(const fs::path& src, const fs::path& dst,
                                                const ProgressCallback& progress,
                                                const CallContext& ctx) const {
  std::ifstream input(src, std::ios::binary);
  if (!input) {
    throw StoreError("Failed to open " + src.string());
  }

  std::ofstream output(dst, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw StoreError("Failed to create " + dst.string());
  }

  crypto::Digest digest(crypto::Digest::Algorithm::MD5);
  std::vector<char> buffer(CHUNK_SIZE);
  std::uintmax_t total_bytes = 0;

  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    ctx.check("transfer of " + src.filename().string());

    auto bytes_read = input.gcount();
    output.write(buffer.data(), bytes_read);
    if (!output) {
      throw StoreError("Failed to write " + dst.string());
    }

    digest.update(buffer.data(), static_cast<size_t>(bytes_read));
    total_bytes += static_cast<std::uintmax_t>(bytes_read);
    if (progress) {
      progress(static_cast<std::uintmax_t>(bytes_read));
    }
  }

  if (input.bad()) {
    throw StoreError("Failed to read " + src.string());
  }

  output.close();
  if (!output) {
    throw StoreError("Failed to close " + dst.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Streamed " << total_bytes << " bytes to " << dst.string();
  return digest.finish_hex();
}

std::string LocalObjectStore::write_multipart(const fs::path& src, const fs::path& dst,
                                              std::uintmax_t size, const ProgressCallback& progress,
                                              const CallContext& ctx) const {
  const std::uintmax_t part_count = (size + part_size_ - 1) / part_size_;
  const std::size_t worker_count = static_cast<std::size_t>(
    std::min<std::uintmax_t>(max_part_workers_, part_count));

  BOOST_LOG_TRIVIAL(info) << "Local store: Multipart transfer of " << size << " bytes in "
                          << part_count << " parts using " << worker_count << " workers";

  // Preallocate so every worker can write its own byte range
  {
    std::ofstream create(dst, std::ios::binary | std::ios::trunc);
    if (!create) {
      throw StoreError("Failed to create " + dst.string());
    }
  }
  fs::resize_file(dst, size);

  std::vector<std::vector<uint8_t>> part_digests(part_count);
  std::atomic<std::uintmax_t> next_part{0};
  std::atomic<bool> failed{false};
  std::mutex error_mutex;
  std::exception_ptr first_error;

  auto worker = [&]() {
    while (!failed) {
      std::uintmax_t part = next_part.fetch_add(1);
      if (part >= part_count) {
        return;
      }

      try {
        std::uintmax_t offset = part * part_size_;
        std::uintmax_t length = std::min(part_size_, size - offset);
        part_digests[part] = copy_part(src, dst, offset, length, progress, ctx);
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Local store: Part " << part + 1 << " failed: " << e.what();
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed = true;
      }
    }
  };

  std::vector<std::thread> workers;
  try {
    for (std::size_t i = 0; i < worker_count; ++i) {
      workers.emplace_back(worker);
    }
  } catch (const std::system_error& e) {
    failed = true;
    for (auto& thread : workers) {
      thread.join();
    }
    throw StoreError(std::string("Failed to start part workers: ") + e.what());
  }

  for (auto& thread : workers) {
    thread.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  crypto::Digest combined(crypto::Digest::Algorithm::MD5);
  for (const auto& part_digest : part_digests) {
    combined.update(part_digest.data(), part_digest.size());
  }
  return combined.finish_hex() + "-" + std::to_string(part_count);
}

std::vector<uint8_t> LocalObjectStore::copy_part(const fs::path& src, const fs::path& dst,
                                                 std::uintmax_t offset, std::uintmax_t length,
                                                 const ProgressCallback& progress,
                                                 const CallContext& ctx) const {
  std::ifstream input(src, std::ios::binary);
  std::fstream output(dst, std::ios::binary | std::ios::in | std::ios::out);
  if (!input || !output) {
    throw StoreError("Failed to open part streams for " + src.string());
  }

  input.seekg(static_cast<std::streamoff>(offset));
  output.seekp(static_cast<std::streamoff>(offset));

  crypto::Digest digest(crypto::Digest::Algorithm::MD5);
  std::vector<char> buffer(CHUNK_SIZE);
  std::uintmax_t remaining = length;

  while (remaining > 0) {
    ctx.check("part transfer of " + src.filename().string());

    auto wanted = static_cast<std::streamsize>(std::min<std::uintmax_t>(remaining, buffer.size()));
    if (!input.read(buffer.data(), wanted)) {
      throw StoreError("Short read in part at offset " + std::to_string(offset));
    }
    output.write(buffer.data(), wanted);
    if (!output) {
      throw StoreError("Failed to write part at offset " + std::to_string(offset));
    }

    digest.update(buffer.data(), static_cast<size_t>(wanted));
    remaining -= static_cast<std::uintmax_t>(wanted);
    if (progress) {
      progress(static_cast<std::uintmax_t>(wanted));
    }
  }

  output.flush();
  if (!output) {
    throw StoreError("Failed to flush part at offset " + std::to_string(offset));
  }
  return digest.finish();
}


//==============================================
// UTILITY METHODS
//==============================================

void LocalObjectStore::check_directory_exists(const fs::path& path) const {
  if (!fs::exists(path)) {
    fs::create_directories(path);
  }
}

void LocalObjectStore::prune_empty_directories(fs::path dir) const {
  std::error_code ec;
  while (dir != root_ && dir.has_parent_path()) {
    if (!fs::is_empty(dir, ec) || ec) {
      break;
    }
    fs::remove(dir, ec);
    if (ec) {
      break;
    }
    dir = dir.parent_path();
  }
}

} // namespace store
} // namespace s3sync
