#include "line_reader.hpp"
#include "codonbias/errors.hpp"

#include <cstring>
#include <fstream>
#include <zlib.h>

namespace codonbias {

constexpr size_t GZBUF_SIZE = 256 * 1024;

class LineReader::Impl {
public:
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    char buffer_[65536];

    bool open(const std::string& filename) {
        if (filename.size() > 3 &&
            filename.substr(filename.size() - 3) == ".gz") {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
            return true;
        }
        file_.open(filename);
        return static_cast<bool>(file_);
    }

    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        line.clear();
        // Lines longer than the buffer arrive in several chunks
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            size_t len = strlen(buffer_);
            bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) len--;
            line.append(buffer_, len);
            if (complete) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
        }
        int errnum = 0;
        const char* msg = gzerror(gz_file_, &errnum);
        if (errnum != Z_OK && errnum != Z_STREAM_END) {
            throw RetrievalError(std::string("gzip read error: ") + msg);
        }
        return !line.empty();
    }

    ~Impl() {
        if (gz_file_) gzclose(gz_file_);
    }
};

LineReader::LineReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw RetrievalError("Failed to open file: " + filename);
    }
}

LineReader::~LineReader() = default;

bool LineReader::getline(std::string& line) {
    if (!impl_->getline(line)) return false;
    ++line_number_;
    return true;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string cur;
    bool in_space_run = false;
    for (char c : line) {
        if (c == '\t' || c == ',') {
            fields.push_back(trim(cur));
            cur.clear();
            in_space_run = false;
        } else if (c == ' ') {
            // Runs of spaces act as one separator, ignored next to tabs/commas
            in_space_run = true;
        } else {
            if (in_space_run && !trim(cur).empty()) {
                fields.push_back(trim(cur));
                cur.clear();
            }
            in_space_run = false;
            cur += c;
        }
    }
    if (!trim(cur).empty() || !fields.empty()) fields.push_back(trim(cur));
    return fields;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace codonbias
