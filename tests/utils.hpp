#pragma once

#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace devhttps::test
{
    namespace fs = std::filesystem;

    // Scratch directory removed (recursively) on destruction
    class TempDir
    {
      public:
        TempDir()
        {
            std::random_device rd;
            auto base = fs::temp_directory_path();
            for (int attempt = 0; attempt < 16; ++attempt)
            {
                auto candidate = base / ("devhttps-test-" + std::to_string(rd()));
                if (fs::create_directory(candidate))
                {
                    path_ = candidate;
                    return;
                }
            }
            throw std::runtime_error("could not create a temporary directory");
        }

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }
        fs::path operator/(const fs::path& rel) const { return path_ / rel; }

      private:
        fs::path path_;
    };

    inline void write_file(const fs::path& p, const std::string& contents)
    {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    inline std::string read_file(const fs::path& p)
    {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Leftover ".<name>.tmp-XXXX" files from interrupted writes
    inline std::size_t count_temp_files(const fs::path& dir)
    {
        std::size_t count = 0;
        for (const auto& entry : fs::directory_iterator(dir))
        {
            if (entry.path().filename().string().find(".tmp-") != std::string::npos)
                ++count;
        }
        return count;
    }

    // Sets (or unsets) an environment variable for the lifetime of the object
    class ScopedEnv
    {
      public:
        ScopedEnv(std::string name, std::optional<std::string> value) : name_{std::move(name)}
        {
            if (const char* old = std::getenv(name_.c_str()))
                old_ = old;
            if (value)
                ::setenv(name_.c_str(), value->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        ~ScopedEnv()
        {
            if (old_)
                ::setenv(name_.c_str(), old_->c_str(), 1);
            else
                ::unsetenv(name_.c_str());
        }

        ScopedEnv(const ScopedEnv&) = delete;
        ScopedEnv& operator=(const ScopedEnv&) = delete;

      private:
        std::string name_;
        std::optional<std::string> old_;
    };

    // argv-style argument list backed by owned strings
    class Args
    {
      public:
        Args(std::initializer_list<std::string> args) : storage_{"devhttps"}
        {
            storage_.insert(storage_.end(), args.begin(), args.end());
            for (auto& s : storage_)
                pointers_.push_back(s.data());
            pointers_.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage_.size()); }
        char** argv() { return pointers_.data(); }

      private:
        std::vector<std::string> storage_;
        std::vector<char*> pointers_;
    };

}  // namespace devhttps::test
