// POST /signup handler driven in-process: prints the raw HTTP response for a
// few sample requests. SIGNUP_SCHEMA_CHECK=0 skips the JSON Schema step.

#include "verity/core/descriptor.hpp"
#include "verity/core/extract.hpp"
#include "verity/core/log.hpp"
#include "verity/core/metrics.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace verity;
using namespace verity::http;

struct signup {
    std::string username;
    std::string email;
    uint16_t age = 0;
    std::optional<std::string> referral;
    std::vector<std::string> interests;
};

namespace verity {

template <> struct validation_traits<signup> {
    static const type_descriptor<signup>& describe() {
        static const auto d =
            type_descriptor<signup>("signup")
                .field("username", &signup::username,
                       rules<std::string>().min_length(3).max_length(20).pattern("[a-z0-9_]+"))
                .field("email", &signup::email, rules<std::string>().pattern(".+@.+\\..+"))
                .field("age", &signup::age, rules<uint16_t>().minimum(13).maximum(130))
                .field("referral", &signup::referral, rules<std::string>().min_length(4))
                .field("interests", &signup::interests,
                       rules<std::vector<std::string>>().max_items(5).unique_items())
                .deny_unknown_fields();
        return d;
    }
};

} // namespace verity

static bool read_flag(const char* env_name, bool fallback) {
    if (const char* value = std::getenv(env_name)) {
        return std::string(value) != "0";
    }
    return fallback;
}

static response register_user(signup&& s) {
    return response::json("{\"created\":\"" + s.username + "\"}", 200);
}

static request post(std::string body) {
    request req;
    req.http_method = method::post;
    req.uri = "/signup";
    req.headers.set("Content-Type", "application/json");
    req.headers.set("Content-Length", std::to_string(body.size()));
    req.body = std::move(body);
    return req;
}

int main() {
    auto options = pipeline_options::from_env();
    options.schema_check = read_flag("SIGNUP_SCHEMA_CHECK", options.schema_check);
    set_log_level(options.level);

    std::vector<request> samples;
    samples.push_back(post(R"({"username":"ada_l","email":"ada@example.org","age":36,"interests":["math"]})"));
    samples.push_back(post(R"({"username":"A","email":"nope","age":7,"interests":["x","x"]})"));
    samples.push_back(post(R"({"username":"ada_l","email":"ada@example.org","age":36,"interests":[],"admin":true})"));
    samples.push_back(post(R"({"username":)"));

    request wrong_type = post(R"({})");
    wrong_type.headers.set("Content-Type", "text/plain");
    samples.push_back(std::move(wrong_type));

    for (const auto& req : samples) {
        response res = handle_json<signup>(req, register_user, options);
        std::cout << method_to_string(req.http_method) << " " << req.uri << "\n"
                  << res.serialize() << "\n\n";
    }

    auto stats = global_metrics().snapshot();
    std::cout << "accepted=" << stats.accepted << " rejected=" << stats.rejected() << std::endl;
    return 0;
}
