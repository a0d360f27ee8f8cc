#include "tinyformer/vocabulary.h"
#include "tinyformer/errors.h"

namespace tinyformer {

Vocabulary::Vocabulary(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        throw InvalidConfigError("Vocabulary needs at least one token");
    }

    for (size_t i = 0; i < tokens.size(); i++) {
        if (tokens[i].empty()) {
            throw InvalidConfigError("Empty token at position " + std::to_string(i));
        }
        if (!token_to_id.emplace(tokens[i], static_cast<int>(i)).second) {
            throw InvalidConfigError("Duplicate token '" + tokens[i] + "'");
        }
        id_to_token.push_back(tokens[i]);
    }
}

int Vocabulary::id(const std::string& token) const {
    auto it = token_to_id.find(token);
    if (it == token_to_id.end()) {
        throw VocabularyError("Unknown token '" + token + "'");
    }
    return it->second;
}

const std::string& Vocabulary::token(int id) const {
    if (id < 0 || id >= size()) {
        throw VocabularyError("Token id " + std::to_string(id) + " out of range [0, " +
                              std::to_string(size()) + ")");
    }
    return id_to_token[id];
}

bool Vocabulary::contains(const std::string& token) const {
    return token_to_id.count(token) > 0;
}

std::vector<int> Vocabulary::encode(const std::vector<std::string>& tokens) const {
    std::vector<int> ids;
    ids.reserve(tokens.size());
    for (const auto& t : tokens) {
        ids.push_back(id(t));
    }
    return ids;
}

std::string Vocabulary::decode(const std::vector<int>& ids) const {
    std::string result;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) result += ' ';
        result += token(ids[i]);
    }
    return result;
}

} // namespace tinyformer
