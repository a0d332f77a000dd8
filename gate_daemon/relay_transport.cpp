#include "relay_transport.hpp"

bool RelayTransport::topicMatches(const std::string &filter, const std::string &topic) {
    size_t f = 0;
    size_t t = 0;

    while (f < filter.size()) {
        size_t f_end = filter.find('/', f);
        if (f_end == std::string::npos) f_end = filter.size();
        std::string level = filter.substr(f, f_end - f);

        if (level == "#") {
            return true;
        }
        if (t > topic.size()) {
            return false;
        }

        size_t t_end = topic.find('/', t);
        if (t_end == std::string::npos) t_end = topic.size();

        if (level != "+" && level != topic.substr(t, t_end - t)) {
            return false;
        }

        f = f_end + 1;
        t = t_end + 1;
    }

    // Both consumed exactly (trailing separators count as levels)
    return t == topic.size() + 1 && f == filter.size() + 1;
}
