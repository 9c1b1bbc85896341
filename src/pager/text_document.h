#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace glide::pager {

class TextDocument {
public:
    TextDocument() = default;
    TextDocument(std::string name, std::vector<std::string> lines);

    // Throws std::runtime_error when the file cannot be read.
    static TextDocument load_file(const std::filesystem::path& path, int tab_width);
    static TextDocument from_stream(std::istream& in, std::string name, int tab_width);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& lines() const { return lines_; }
    std::size_t line_count() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    const std::string& line(std::size_t index) const;

private:
    std::string name_;
    std::vector<std::string> lines_;
};

std::string expand_tabs(const std::string& line, int tab_width);

} // namespace glide::pager
