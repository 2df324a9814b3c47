#ifndef TINYDC_TESTS_TEMPDIR_HPP
#define TINYDC_TESTS_TEMPDIR_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "tinydc-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        // Canonical so comparisons against normalized index keys hold even if /tmp is a symlink.
        path_ = std::filesystem::canonical(buffer.data());
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::filesystem::path MakeDir(const std::string& relative) const {
        const std::filesystem::path dir = path_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path MakeFile(const std::string& relative, const std::string& contents = "") const {
        const std::filesystem::path file = path_ / relative;
        std::ofstream out(file);
        out << contents;
        return file;
    }

private:
    std::filesystem::path path_;
};

#endif // TINYDC_TESTS_TEMPDIR_HPP
