#include "text_document.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace glide::pager {

namespace {
const std::string kEmptyLine;
} // namespace

TextDocument::TextDocument(std::string name, std::vector<std::string> lines)
    : name_(std::move(name))
    , lines_(std::move(lines)) {}

TextDocument TextDocument::load_file(const std::filesystem::path& path, int tab_width) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Unable to open '" + path.string() + "'");
    }
    return from_stream(in, path.filename().string(), tab_width);
}

TextDocument TextDocument::from_stream(std::istream& in, std::string name, int tab_width) {
    std::vector<std::string> lines;
    std::string raw;
    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        lines.push_back(expand_tabs(raw, tab_width));
    }
    if (in.bad()) {
        throw std::runtime_error("Failed while reading '" + name + "'");
    }
    return TextDocument(std::move(name), std::move(lines));
}

const std::string& TextDocument::line(std::size_t index) const {
    return index < lines_.size() ? lines_[index] : kEmptyLine;
}

std::string expand_tabs(const std::string& line, int tab_width) {
    const std::size_t width = static_cast<std::size_t>(std::max(1, tab_width));
    std::string out;
    out.reserve(line.size());
    std::size_t column = 0;
    for (const char ch : line) {
        if (ch == '\t') {
            const std::size_t pad = width - (column % width);
            out.append(pad, ' ');
            column += pad;
            continue;
        }
        out.push_back(ch);
        // UTF-8 continuation bytes do not start a new column.
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++column;
        }
    }
    return out;
}

} // namespace glide::pager
