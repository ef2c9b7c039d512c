#pragma once
#include <ostream>
#include <string>

// Tagged status lines, e.g. "[Apply] warn: ...". Safe to call from the
// generator thread and the caller at the same time.
namespace Log {
    void info(const std::string& tag, const std::string& message);
    void warn(const std::string& tag, const std::string& message);
    void error(const std::string& tag, const std::string& message);

    // redirect output, defaults to std::cerr. The stream must outlive its use.
    void setStream(std::ostream& out);
    void resetStream();
}
