#ifndef VAULT_TEST_UTILS_HPP
#define VAULT_TEST_UTILS_HPP

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

namespace vault {
namespace test {

// Set logging severity level and configure logging
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::add_common_attributes();
}

// Spawns body as a coroutine, runs the io_context until it has no work left
// and rethrows whatever the coroutine threw
template <typename Body>
void run_coroutine(boost::asio::io_context& io_context, Body body) {
    std::exception_ptr failure;
    boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
        try {
            body(yield);
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    });
    io_context.run();
    io_context.restart();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

// Unique scratch directory removed on destruction
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix) {
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

} // namespace test
} // namespace vault

#endif // VAULT_TEST_UTILS_HPP
