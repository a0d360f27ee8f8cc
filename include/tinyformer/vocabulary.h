#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace tinyformer {

// Fixed token <-> id mapping. The id of a token is its position in the list
// the vocabulary was built from.
class Vocabulary {
    private:
        std::vector<std::string> id_to_token;
        std::unordered_map<std::string, int> token_to_id;
    public:
        explicit Vocabulary(const std::vector<std::string>& tokens);

        int id(const std::string& token) const;
        const std::string& token(int id) const;
        bool contains(const std::string& token) const;

        std::vector<int> encode(const std::vector<std::string>& tokens) const;
        // Space separated.
        std::string decode(const std::vector<int>& ids) const;

        int size() const { return static_cast<int>(id_to_token.size()); }
};

} // namespace tinyformer
