#include "./io.hpp"

#include <cubuild/error/result.hpp>
#include <cubuild/util/fs/path.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace cubuild;

namespace {

[[noreturn]] void throw_io_error(int e, std::string_view what, path_ref fpath) {
    auto ec = std::error_code{e, std::system_category()};
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, neo::ufmt("{} [{}]", what, fpath.string())),
                               boost::leaf::e_errno{e},
                               ec);
}

}  // namespace

std::string cubuild::read_file(path_ref path) {
    CUBUILD_E_SCOPE(e_file_path{path});
    errno = 0;
    std::ifstream infile{path, std::ios::binary};
    if (!infile) {
        throw_io_error(errno, "Failed to open file for reading", path);
    }
    std::ostringstream out;
    out << infile.rdbuf();
    if (infile.bad()) {
        throw_io_error(errno, "Failed to read from file", path);
    }
    return std::move(out).str();
}

void cubuild::write_file(path_ref dest, std::string_view content) {
    CUBUILD_E_SCOPE(e_file_path{dest});
    errno = 0;
    std::ofstream ofile{dest, std::ios::binary | std::ios::trunc};
    if (!ofile) {
        throw_io_error(errno, "Failed to open file for writing", dest);
    }
    ofile.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofile.flush();
    if (!ofile) {
        throw_io_error(errno, "Failed to write to file", dest);
    }
}
