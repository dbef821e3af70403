#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace dualst {

// ESPnet token list shared by both streams.
// char_list = <blank> (id 0), dict units (ids 1..N), <eos> (id N+1).
// The last entry doubles as start-of-sequence.
class Vocabulary {
  public:
    // Load an ESPnet dict file ("<token> <id>" per line, ids from 1).
    void load(const std::string &dict_path);

    // Build from dict units without a file.
    static Vocabulary from_units(const std::vector<std::string> &units);

    bool loaded() const { return !char_list_.empty(); }
    size_t size() const { return char_list_.size(); }
    int blank() const { return 0; }
    int eos() const { return static_cast<int>(char_list_.size()) - 1; }

    // -1 when the token is unknown.
    int id(const std::string &token) const;

    // Throws std::out_of_range for ids outside the list.
    const std::string &token(int id) const;

    // Id of the "<2xx>" language tag; throws std::invalid_argument if absent.
    int language_token(const std::string &lang) const;

    std::vector<std::string> tokens(const std::vector<int> &ids) const;

    // Detokenize: drops blank, eos and language tags, joins the pieces and
    // turns U+2581 word markers into spaces.
    std::string decode(const std::vector<int> &ids) const;

    const std::vector<std::string> &char_list() const { return char_list_; }

  private:
    std::vector<std::string> char_list_;
    std::unordered_map<std::string, int> token_to_id_;

    void build_index_();
};

bool is_language_tag(const std::string &token);

} // namespace dualst
