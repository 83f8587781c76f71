#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "config/sync_config.hpp"
#include "store/object_store.hpp"

namespace s3sync {
namespace store {

// Bucket kept in a local directory. Object paths are derived from the SHA-256
// of the key: {root}/{bucket}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{rest}, with
// the object metadata in a "{rest}.meta" sidecar beside the content.
class LocalObjectStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalObjectStore(const config::SyncConfig& config);
  ~LocalObjectStore() override = default;

  const std::string& bucket() const override { return bucket_; }
  const std::filesystem::path& root() const { return root_; }


  // ---- QUERY OPERATIONS ----
  std::optional<ObjectInfo> head(const std::string& key, const CallContext& ctx) override;
  std::vector<ObjectInfo> list(const std::string& prefix, const CallContext& ctx) override;

  // ACL and encryption marker recorded for a key, for inspection
  TransferOptions options_of(const std::string& key) const;


  // ---- MUTATING OPERATIONS ----
  void copy(const std::string& src_key, const std::string& dst_key,
            const TransferOptions& options, const CallContext& ctx) override;
  void remove(const std::string& key, const CallContext& ctx) override;


  // ---- TRANSFERS ----
  void upload(const std::filesystem::path& local_path, const std::string& key,
              const TransferOptions& options, const ProgressCallback& progress,
              const CallContext& ctx) override;
  void download(const std::string& key, const std::filesystem::path& local_path,
                const ProgressCallback& progress, const CallContext& ctx) override;

private:
  // Sidecar contents
  struct Metadata {
    ObjectInfo info;
    TransferOptions options;
  };

  // ---- PARAMETERS ----
  std::string bucket_;
  std::filesystem::path root_;
  std::uintmax_t multipart_threshold_;
  std::uintmax_t part_size_;
  std::size_t max_part_workers_;

  static constexpr size_t CHUNK_SIZE = 64 * 1024;


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the key hash
  std::filesystem::path object_path(const std::string& key) const;
  std::filesystem::path metadata_path(const std::string& key) const;
  void validate_key(const std::string& key) const;


  // ---- METADATA ----
  std::optional<Metadata> read_metadata(const std::filesystem::path& meta_path) const;
  void write_metadata(const std::string& key, const Metadata& metadata) const;


  // ---- TRANSFER SUPPORT ----
  // Streams the file into dst in chunks, returns the hex MD5 of the content
  std::string write_single_part(const std::filesystem::path& src, const std::filesystem::path& dst,
                                const ProgressCallback& progress, const CallContext& ctx) const;
  // Splits the file into parts hashed and written by parallel workers,
  // returns the multipart ETag "{md5 of part md5s}-{part count}"
  std::string write_multipart(const std::filesystem::path& src, const std::filesystem::path& dst,
                              std::uintmax_t size, const ProgressCallback& progress,
                              const CallContext& ctx) const;
  // Copies one byte range between files, reporting progress per chunk
  std::vector<uint8_t> copy_part(const std::filesystem::path& src, const std::filesystem::path& dst,
                                 std::uintmax_t offset, std::uintmax_t length,
                                 const ProgressCallback& progress, const CallContext& ctx) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty hash directories left behind after a delete
  void prune_empty_directories(std::filesystem::path dir) const;
};

} // namespace store
} // namespace s3sync
