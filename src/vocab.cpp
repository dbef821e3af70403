#include "dualst/vocab.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dualst {

bool is_language_tag(const std::string &token) {
    return token.size() > 4 && token.starts_with("<2") && token.back() == '>';
}

void Vocabulary::load(const std::string &dict_path) {
    std::ifstream file(dict_path);
    if (!file) {
        throw std::runtime_error("Cannot open dict file: " + dict_path);
    }

    std::vector<std::string> units;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty())
            continue;
        // ESPnet dict format: token<space>id
        std::istringstream ss(line);
        std::string unit;
        int id = 0;
        if (!(ss >> unit >> id)) {
            throw std::runtime_error("Malformed dict line " +
                                     std::to_string(line_no) + " in " +
                                     dict_path);
        }
        if (id != static_cast<int>(units.size()) + 1) {
            throw std::runtime_error(
                "Dict ids must be consecutive from 1: got " +
                std::to_string(id) + " for '" + unit + "' at line " +
                std::to_string(line_no));
        }
        units.push_back(unit);
    }
    if (units.empty()) {
        throw std::runtime_error("Dict file is empty: " + dict_path);
    }
    *this = from_units(units);
}

Vocabulary Vocabulary::from_units(const std::vector<std::string> &units) {
    Vocabulary v;
    v.char_list_.reserve(units.size() + 2);
    v.char_list_.push_back("<blank>");
    v.char_list_.insert(v.char_list_.end(), units.begin(), units.end());
    v.char_list_.push_back("<eos>");
    v.build_index_();
    return v;
}

void Vocabulary::build_index_() {
    token_to_id_.clear();
    for (size_t i = 0; i < char_list_.size(); ++i) {
        // first occurrence wins
        token_to_id_.emplace(char_list_[i], static_cast<int>(i));
    }
}

int Vocabulary::id(const std::string &token) const {
    auto it = token_to_id_.find(token);
    return it == token_to_id_.end() ? -1 : it->second;
}

const std::string &Vocabulary::token(int id) const {
    if (id < 0 || id >= static_cast<int>(char_list_.size())) {
        throw std::out_of_range("Token id out of range: " +
                                std::to_string(id));
    }
    return char_list_[id];
}

int Vocabulary::language_token(const std::string &lang) const {
    auto tag = "<2" + lang + ">";
    int tid = id(tag);
    if (tid < 0) {
        throw std::invalid_argument("Language tag " + tag +
                                    " not in vocabulary");
    }
    return tid;
}

std::vector<std::string> Vocabulary::tokens(const std::vector<int> &ids) const {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (int i : ids) {
        if (i >= 0 && i < static_cast<int>(char_list_.size())) {
            out.push_back(char_list_[i]);
        } else {
            out.push_back("[" + std::to_string(i) + "]");
        }
    }
    return out;
}

std::string Vocabulary::decode(const std::vector<int> &ids) const {
    std::string joined;
    for (int i : ids) {
        if (i == blank() || i == eos())
            continue;
        if (i < 0 || i >= static_cast<int>(char_list_.size())) {
            joined += "[" + std::to_string(i) + "]";
            continue;
        }
        if (is_language_tag(char_list_[i]))
            continue;
        joined += char_list_[i];
    }

    // U+2581 (\xe2\x96\x81) marks a word start
    const std::string marker = "\xe2\x96\x81";
    std::string output;
    size_t pos = 0;
    while (pos < joined.size()) {
        if (pos + 3 <= joined.size() && joined.compare(pos, 3, marker) == 0) {
            output += ' ';
            pos += 3;
        } else {
            output += joined[pos];
            ++pos;
        }
    }

    auto first = output.find_first_not_of(' ');
    if (first == std::string::npos)
        return "";
    auto last = output.find_last_not_of(' ');
    return output.substr(first, last - first + 1);
}

} // namespace dualst
