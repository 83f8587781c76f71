#ifndef S3SYNC_SYNC_BATCH_RESULT_HPP
#define S3SYNC_SYNC_BATCH_RESULT_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace s3sync {
namespace sync {

// Source and destination lists of different lengths
class ContractViolation : public std::invalid_argument {
public:
  explicit ContractViolation(const std::string& message)
    : std::invalid_argument("Contract violation: " + message) {}
};

enum class Outcome {
  Succeeded,
  Skipped,
  Failed
};

inline const char* outcome_to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::Succeeded: return "succeeded";
    case Outcome::Skipped: return "skipped";
    case Outcome::Failed: return "failed";
    default: return "unknown";
  }
}

struct ItemResult {
  std::size_t index{0};
  std::string source;
  std::string destination;
  Outcome outcome{Outcome::Failed};
  std::string reason;
};

// One ItemResult per pair of a bulk operation, in input order
class BatchResult {
public:
  void add(ItemResult item) { items_.push_back(std::move(item)); }

  const std::vector<ItemResult>& items() const { return items_; }
  const ItemResult& at(std::size_t index) const { return items_.at(index); }
  std::size_t size() const { return items_.size(); }

  std::size_t count(Outcome outcome) const;
  std::size_t succeeded() const { return count(Outcome::Succeeded); }
  std::size_t skipped() const { return count(Outcome::Skipped); }
  std::size_t failed() const { return count(Outcome::Failed); }
  bool all_ok() const { return failed() == 0; }

  // "<n> succeeded, <n> skipped, <n> failed"
  std::string summary() const;

private:
  std::vector<ItemResult> items_;
};

} // namespace sync
} // namespace s3sync

#endif // S3SYNC_SYNC_BATCH_RESULT_HPP
