/**
 * devhttps - Local HTTPS Development Server
 * openssl command-line strategy implementation
 */

#include "credentials/openssl_cli_strategy.hpp"
#include "credentials/self_signed.hpp"
#include "util/atomic_file.hpp"

#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <deque>
#include <stdexcept>
#include <system_error>

namespace devhttps::credentials {

namespace bp = boost::process;

namespace {

// Lines of tool output kept for the failure detail
constexpr std::size_t kOutputTailLines = 3;

std::string join_tail(const std::deque<std::string>& lines) {
    std::string result;
    for (const auto& line : lines) {
        if (!result.empty()) {
            result += " | ";
        }
        result += line;
    }
    return result;
}

} // anonymous namespace

OpenSslCliStrategy::OpenSslCliStrategy(std::string executable)
    : executable_(std::move(executable))
{
}

std::optional<std::filesystem::path> OpenSslCliStrategy::resolve_executable() const {
    if (executable_.empty()) {
        return std::nullopt;
    }

    if (executable_.find('/') != std::string::npos) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(executable_, ec)) {
            return std::filesystem::path(executable_);
        }
        return std::nullopt;
    }

    boost::filesystem::path found = bp::search_path(executable_);
    if (found.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path(found.string());
}

std::vector<std::string> OpenSslCliStrategy::build_arguments(const std::filesystem::path& output) {
    return {
        "req", "-new", "-x509",
        "-newkey", "rsa:" + std::to_string(kRsaKeyBits),
        "-keyout", output.string(),
        "-out", output.string(),
        "-days", std::to_string(kValidityDays),
        "-nodes",
        "-subj", "/CN=" + std::string(kCommonName),
        "-addext", "subjectAltName=" + std::string(kSubjectAltNames)
    };
}

ProvisionResult OpenSslCliStrategy::provision(const std::filesystem::path& bundle_path) {
    ProvisionResult result;
    result.strategy = std::string(name());

    auto executable = resolve_executable();
    if (!executable) {
        result.status = ProvisionStatus::ToolMissing;
        result.detail = "'" + executable_ + "' not found";
        return result;
    }

    util::TempFileGuard temp(util::make_temp_sibling(bundle_path));
    auto args = build_arguments(temp.path());

    spdlog::debug("Running {} {}", executable->string(), fmt::join(args, " "));

    int exit_code = 0;
    std::deque<std::string> tail;
    try {
        bp::ipstream output;
        bp::child proc(
            boost::filesystem::path(executable->string()),
            bp::args(args),
            bp::std_in < bp::null,
            (bp::std_out & bp::std_err) > output);

        // Drain the pipe before waiting so the tool never blocks on a full pipe
        std::string line;
        while (std::getline(output, line)) {
            spdlog::debug("openssl: {}", line);
            tail.push_back(line);
            if (tail.size() > kOutputTailLines) {
                tail.pop_front();
            }
        }

        proc.wait();
        exit_code = proc.exit_code();
    } catch (const bp::process_error& e) {
        result.status = ProvisionStatus::ToolMissing;
        result.detail = "failed to launch " + executable->string() + ": " + e.what();
        return result;
    }

    if (exit_code != 0) {
        result.status = ProvisionStatus::ToolFailed;
        result.detail = executable->string() + " exited with status " + std::to_string(exit_code);
        if (!tail.empty()) {
            result.detail += ": " + join_tail(tail);
        }
        return result;
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(temp.path(), ec);
    if (ec || size == 0) {
        result.status = ProvisionStatus::ToolFailed;
        result.detail = executable->string() + " exited successfully but wrote no bundle";
        return result;
    }

    std::filesystem::permissions(temp.path(), util::kPrivateFilePerms, ec);
    if (ec) {
        spdlog::warn("Could not restrict permissions of {}: {}", temp.path().string(), ec.message());
    }

    try {
        util::commit_file(temp.path(), bundle_path);
    } catch (const std::runtime_error& e) {
        result.status = ProvisionStatus::ToolFailed;
        result.detail = e.what();
        return result;
    }
    temp.release();

    result.status = ProvisionStatus::Generated;
    result.detail = "generated by " + executable->string();
    return result;
}

} // namespace devhttps::credentials
