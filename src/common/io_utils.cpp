#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, system_category(), "unable to open " + path.string());
    fout << content;
    fout.close();
    if (!fout) throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_filename(const string &name) {
    if (name.empty() || name == "." || name == ".." || name.find('/') != string::npos || name.find('\0') != string::npos)
        throw invalid_argument("file name is not safe: " + name);
    return name;
}

scratch_directory::scratch_directory(const fs::path &root, bool keep) : keep(keep), valid(false) {
    // uuid 保证并发提交的目录互不相同，即使是同一个选手的同一道题
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    dir = root / uuid;
    error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw sandbox_error("unable to create scratch directory " + dir.string() + ": " + ec.message());
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) throw sandbox_error("unable to set permissions of scratch directory " + dir.string() + ": " + ec.message());
    valid = true;
}

scratch_directory::scratch_directory(scratch_directory &&other) noexcept
    : dir(move(other.dir)), keep(other.keep), valid(other.valid) {
    other.valid = false;
}

scratch_directory::~scratch_directory() {
    release();
}

const fs::path &scratch_directory::path() const {
    return dir;
}

void scratch_directory::release() {
    if (!valid) return;
    valid = false;
    if (keep) {
        LOG(INFO) << "Keeping scratch directory " << dir;
        return;
    }
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "Unable to delete scratch directory " << dir << ": " << ec.message();
}

}  // namespace arbiter
