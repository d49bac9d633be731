#ifndef S3_MULTIPART_UNIT_TESTS_TEMPORARY_DIRECTORY_HPP
#define S3_MULTIPART_UNIT_TESTS_TEMPORARY_DIRECTORY_HPP

#include <boost/filesystem.hpp>

#include <fstream>
#include <string>

// Creates a unique directory under the system temp path and removes it on destruction.
class temporary_directory
{
public:
    temporary_directory()
        : path_{boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("s3-multipart-%%%%-%%%%-%%%%")}
    {
        boost::filesystem::create_directories(path_);
    }

    ~temporary_directory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path_, ec);
    }

    temporary_directory(const temporary_directory&) = delete;
    temporary_directory& operator=(const temporary_directory&) = delete;

    auto path() const -> const boost::filesystem::path& { return path_; }

    auto write(const std::string& _name, const std::string& _contents) const -> boost::filesystem::path
    {
        const auto p = path_ / _name;
        std::ofstream ofs{p.string(), std::ios::out | std::ios::binary | std::ios::trunc};
        ofs << _contents;
        return p;
    }

private:
    boost::filesystem::path path_;
}; // class temporary_directory

#endif // S3_MULTIPART_UNIT_TESTS_TEMPORARY_DIRECTORY_HPP
