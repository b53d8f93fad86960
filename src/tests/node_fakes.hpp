#ifndef VAULT_TEST_NODE_FAKES_HPP
#define VAULT_TEST_NODE_FAKES_HPP

#include <functional>
#include <string>
#include <vector>
#include <gmock/gmock.h>
#include "node/types.hpp"
#include "storage/file_store.hpp"

namespace vault {
namespace test {

inline node::UploadMetadata make_metadata(const std::string& object_id,
                                          const std::string& created_at = "2024-01-31T12:30:45.1234567Z") {
    node::UploadMetadata metadata;
    metadata.object_id = object_id;
    metadata.created_at_utc = created_at;
    metadata.content_type = "application/octet-stream";
    metadata.original_filename = object_id;
    return metadata;
}

inline node::UploadUnit metadata_unit(const node::UploadMetadata& metadata) {
    node::UploadUnit unit;
    unit.kind = node::UploadUnit::Kind::METADATA;
    unit.metadata = metadata;
    return unit;
}

inline node::UploadUnit chunk_unit(const std::string& data) {
    node::UploadUnit unit;
    unit.kind = node::UploadUnit::Kind::CHUNK;
    unit.chunk.assign(data.begin(), data.end());
    return unit;
}

// Upload stream over a fixed list of units. before_next runs ahead of each
// pull with the index of the unit about to be handed out.
class ScriptedUploadStream : public node::UploadStream {
public:
    explicit ScriptedUploadStream(std::vector<node::UploadUnit> units) : units_(std::move(units)) {}

    bool next(node::UploadUnit& unit, boost::asio::yield_context) override {
        if (before_next) {
            before_next(index_);
        }
        if (index_ >= units_.size()) {
            return false;
        }
        unit = units_[index_++];
        return true;
    }

    std::function<void(std::size_t)> before_next;

private:
    std::vector<node::UploadUnit> units_;
    std::size_t index_ = 0;
};

// Download sink that keeps every chunk it receives
class CollectingSink : public node::ChunkSink {
public:
    void write(const std::vector<char>& chunk, boost::asio::yield_context) override {
        if (on_write) {
            on_write(chunks.size());
        }
        chunks.push_back(chunk);
        data.append(chunk.begin(), chunk.end());
    }

    std::vector<std::vector<char>> chunks;
    std::string data;
    std::function<void(std::size_t)> on_write;
};

class MockFileStore : public storage::FileStore {
public:
    MOCK_METHOD(std::uintmax_t, write,
                (const std::filesystem::path&, storage::ByteSource&, boost::asio::yield_context), (override));
    MOCK_METHOD(std::unique_ptr<storage::ByteSource>, read,
                (const std::filesystem::path&, std::size_t, boost::asio::yield_context), (override));
    MOCK_METHOD(bool, remove, (const std::filesystem::path&, boost::asio::yield_context), (override));
    MOCK_METHOD(bool, exists, (const std::filesystem::path&, boost::asio::yield_context), (override));
    MOCK_METHOD(std::uintmax_t, size, (const std::filesystem::path&, boost::asio::yield_context), (override));
    MOCK_METHOD(void, move,
                (const std::filesystem::path&, const std::filesystem::path&, boost::asio::yield_context),
                (override));
    MOCK_METHOD(void, ensure_directory, (const std::filesystem::path&, boost::asio::yield_context), (override));
    MOCK_METHOD(bool, is_directory, (const std::filesystem::path&, boost::asio::yield_context), (override));
    MOCK_METHOD(storage::VolumeSpace, space, (const std::filesystem::path&, boost::asio::yield_context),
                (override));
};

} // namespace test
} // namespace vault

#endif // VAULT_TEST_NODE_FAKES_HPP
