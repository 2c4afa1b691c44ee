#include "verity/core/error_tree.hpp"

namespace verity {

void append_pointer_token(std::string& path, std::string_view token) {
    path.push_back('/');
    for (char c : token) {
        if (c == '~') {
            path.append("~0");
        } else if (c == '/') {
            path.append("~1");
        } else {
            path.push_back(c);
        }
    }
}

} // namespace verity
