#include "node/upload_coordinator.hpp"
#include "node/timestamp.hpp"
#include "storage/sha256_digest.hpp"
#include "storage/storage_error.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include <boost/log/trivial.hpp>

namespace vault {
namespace node {

namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

// Feeds payload units to the file store, hashing exactly the bytes handed out
class DigestingSource : public storage::ByteSource {
public:
  DigestingSource(UploadStream& stream, sync::CancellationSignal& cancel,
                  storage::Sha256Digest& digest, bool& started)
    : stream_(stream), cancel_(cancel), digest_(digest), started_(started) {}

  bool next(std::vector<char>& chunk, boost::asio::yield_context yield) override {
    // The store asks for data only once the temp file exists
    started_ = true;
    cancel_.throw_if_cancelled();

    if (!stream_.next(unit_, yield)) {
      chunk.clear();
      return false;
    }
    cancel_.throw_if_cancelled();

    if (unit_.kind == UploadUnit::Kind::METADATA) {
      throw RpcError(StatusCode::INVALID_ARGUMENT, "Metadata may only be sent once per upload");
    }

    digest_.update(unit_.chunk.data(), unit_.chunk.size());
    chunk.swap(unit_.chunk);
    return true;
  }

private:
  UploadStream& stream_;
  sync::CancellationSignal& cancel_;
  storage::Sha256Digest& digest_;
  bool& started_;
  UploadUnit unit_;
};

struct Failure {
  StatusCode code;
  std::string message;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

UploadCoordinator::UploadCoordinator(sync::ConcurrencyAdmission& admission, sync::KeyedLockManager& locks,
                                     storage::FileStore& store, const storage::PathMapper& paths)
  : admission_(admission)
  , locks_(locks)
  , store_(store)
  , paths_(paths) {}


//==============================================
// UPLOAD OPERATION
//==============================================

UploadResult UploadCoordinator::upload(UploadStream& stream, sync::CancellationSignal& cancel,
                                       boost::asio::yield_context yield) {
  Attempt attempt;
  std::optional<Failure> failure;

  // Only classify inside the handlers; cleanup may suspend and has to run
  // outside of them
  try {
    return run(attempt, stream, cancel, yield);
  }
  catch (const sync::OperationCancelled& e) {
    BOOST_LOG_TRIVIAL(warning) << "Upload: Cancelled for object " << attempt.object_id
                               << " (" << e.what() << ")";
    failure = Failure{status_for_cancel(e.reason()), "Upload cancelled"};
  }
  catch (const RpcError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Upload: Rejected stream for object " << attempt.object_id
                               << ": " << e.what();
    failure = Failure{e.code(), e.what()};
  }
  catch (const storage::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: IO error for object " << attempt.object_id << ": " << e.what();
    if (e.is_disk_full()) {
      failure = Failure{StatusCode::RESOURCE_EXHAUSTED, "Insufficient disk space"};
    }
    else {
      failure = Failure{StatusCode::INTERNAL, std::string("IO error: ") + e.what()};
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Unexpected error for object " << attempt.object_id
                             << ": " << e.what();
    failure = Failure{StatusCode::INTERNAL, std::string("Unexpected error: ") + e.what()};
  }

  attempt.state.transition_to(failure->code == StatusCode::CANCELLED ||
                              failure->code == StatusCode::DEADLINE_EXCEEDED
                              ? UploadState::State::CANCELLED
                              : UploadState::State::FAILED);
  discard_temp(attempt, yield);
  attempt.key_lock.release();
  attempt.slot.release();

  throw RpcError(failure->code, failure->message);
}

std::optional<std::string> UploadCoordinator::validate_metadata(const UploadMetadata& metadata) {
  if (is_blank(metadata.object_id)) {
    return std::string("ObjectId is required");
  }
  if (!storage::PathMapper::is_safe_filename(metadata.object_id)) {
    return std::string("ObjectId must not contain path separators");
  }
  if (is_blank(metadata.created_at_utc)) {
    return std::string("CreatedAtUtc is required");
  }
  if (!is_valid_created_at(metadata.created_at_utc)) {
    return std::string("CreatedAtUtc must be in ISO-8601 format with Z suffix");
  }
  return std::nullopt;
}


//==============================================
// UPLOAD PHASES
//==============================================

UploadResult UploadCoordinator::run(Attempt& attempt, UploadStream& stream, sync::CancellationSignal& cancel,
                                    boost::asio::yield_context yield) {
  attempt.slot = admission_.acquire_upload(cancel, yield);

  UploadUnit first;
  if (!stream.next(first, yield)) {
    throw RpcError(StatusCode::INVALID_ARGUMENT, "Upload stream ended before metadata");
  }
  cancel.throw_if_cancelled();
  if (first.kind != UploadUnit::Kind::METADATA) {
    throw RpcError(StatusCode::INVALID_ARGUMENT, "First upload message must carry metadata");
  }

  const UploadMetadata metadata = std::move(first.metadata);
  if (auto rejection = validate_metadata(metadata)) {
    BOOST_LOG_TRIVIAL(info) << "Upload: Rejected metadata for object '" << metadata.object_id
                            << "': " << *rejection;
    attempt.state.transition_to(UploadState::State::FAILED);
    return UploadResult::rejected(*rejection);
  }

  attempt.object_id = metadata.object_id;
  BOOST_LOG_TRIVIAL(info) << "Upload: Starting object " << attempt.object_id
                          << ", content type '" << metadata.content_type
                          << "', original filename '" << metadata.original_filename << "'";

  attempt.key_lock = locks_.lock(paths_.lock_key(attempt.object_id), cancel, yield);

  attempt.temp_path = paths_.temp_path(attempt.object_id);
  attempt.state.transition_to(UploadState::State::STREAMING);
  store_.ensure_directory(attempt.temp_path, yield);

  storage::Sha256Digest digest;
  DigestingSource source(stream, cancel, digest, attempt.temp_created);
  std::uint64_t size = store_.write(attempt.temp_path, source, yield);
  cancel.throw_if_cancelled();

  attempt.state.transition_to(UploadState::State::FINALIZING);
  std::string checksum = digest.finalize_hex();

  auto destination = choose_destination(paths_.final_path(attempt.object_id), yield);
  store_.ensure_directory(destination, yield);
  cancel.throw_if_cancelled();

  store_.move(attempt.temp_path, destination, yield);
  attempt.temp_path.clear();
  attempt.temp_created = false;
  attempt.state.transition_to(UploadState::State::COMMITTED);

  UploadResult result;
  result.success = true;
  result.final_path = paths_.relative_to_base(destination);
  result.size = size;
  result.checksum = checksum;

  BOOST_LOG_TRIVIAL(info) << "Upload: Committed object " << attempt.object_id << " at " << result.final_path
                          << " (" << size << " bytes, sha256 " << checksum << ")";
  return result;
}

std::filesystem::path UploadCoordinator::choose_destination(const std::filesystem::path& canonical,
                                                            boost::asio::yield_context yield) {
  if (!store_.exists(canonical, yield)) {
    return canonical;
  }

  const auto directory = canonical.parent_path();
  const std::string stem = canonical.stem().string();
  const std::string extension = canonical.extension().string();

  for (std::uint64_t version = 1;; ++version) {
    auto candidate = directory / (stem + "_" + std::to_string(version) + extension);
    if (!store_.exists(candidate, yield)) {
      BOOST_LOG_TRIVIAL(debug) << "Upload: Canonical path taken, using version " << version;
      return candidate;
    }
  }
}

void UploadCoordinator::discard_temp(Attempt& attempt, boost::asio::yield_context yield) {
  if (!attempt.temp_created || attempt.temp_path.empty()) {
    return;
  }

  try {
    if (store_.remove(attempt.temp_path, yield)) {
      BOOST_LOG_TRIVIAL(debug) << "Upload: Removed temp file " << attempt.temp_path.string();
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Upload: Failed to remove temp file " << attempt.temp_path.string()
                               << ": " << e.what();
  }
  attempt.temp_path.clear();
  attempt.temp_created = false;
}

} // namespace node
} // namespace vault
