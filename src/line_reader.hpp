#pragma once
// Line-oriented reader for plain or gzip compressed text files

#include <memory>
#include <string>
#include <vector>

namespace codonbias {

class LineReader {
public:
    // Throws RetrievalError if the file cannot be opened
    explicit LineReader(const std::string& filename);
    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Next line without its trailing newline; false at end of file
    bool getline(std::string& line);

    size_t line_number() const { return line_number_; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    size_t line_number_ = 0;
};

// Split on tabs, commas or runs of spaces
std::vector<std::string> split_fields(const std::string& line);

// Strip surrounding whitespace
std::string trim(const std::string& s);

} // namespace codonbias
