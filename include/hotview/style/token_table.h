#pragma once
#include <hotview/style/style_op.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hotview::style {

// Exact-match class tokens and the operations each one expands to. The table
// is generated once from prefix, step and keyword data.
class TokenTable {
public:
    static const TokenTable& instance();

    // nullptr when the token is not an enumerated token.
    const std::vector<StyleOp>* find(std::string_view token) const;
    bool contains(std::string_view token) const { return find(token) != nullptr; }

    std::size_t size() const { return entries_.size(); }

private:
    TokenTable();

    void add(std::string token, std::vector<StyleOp> ops);
    void add_flags();
    void add_sizing();
    void add_spacing();
    void add_borders();
    void add_radii();
    void add_typography();

    std::unordered_map<std::string, std::vector<StyleOp>> entries_;
};

} // namespace hotview::style
