#include "cluster/index_metadata.h"

namespace searchlink::cluster {

std::vector<std::string> splitDateFormats(const std::string& format) {
    static const std::string kSeparator = "||";

    // Without any separator the value is a single format, even when empty
    if (format.find(kSeparator) == std::string::npos) {
        return {format};
    }

    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        size_t pos = format.find(kSeparator, start);
        if (pos == std::string::npos) {
            result.push_back(format.substr(start));
            break;
        }
        result.push_back(format.substr(start, pos - start));
        start = pos + kSeparator.size();
    }

    while (!result.empty() && result.back().empty()) {
        result.pop_back();
    }
    return result;
}

std::string joinDateFormats(const std::vector<std::string>& formats) {
    std::string result;
    for (size_t i = 0; i < formats.size(); ++i) {
        if (i > 0) {
            result += "||";
        }
        result += formats[i];
    }
    return result;
}

} // namespace searchlink::cluster
