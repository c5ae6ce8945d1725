//
// Created by Matthew Krueger on 10/19/26.
//

#ifndef FEATUREMINER_LOGGING_HPP
#define FEATUREMINER_LOGGING_HPP

#include <iostream>

namespace featureminer::logging {

    enum class Level {
        Warning = 0,
        Info = 1,
        Debug = 2
    };

    inline Level& verbosity() {
        static Level level = Level::Warning;
        return level;
    }

    inline void setVerbosity(Level level) { verbosity() = level; }

    inline bool isEnabled(Level level) {
        return static_cast<int>(level) <= static_cast<int>(verbosity());
    }

}

// Stream-style logging. Do not call from inside an OpenMP parallel region.
#define FEATUREMINER_LOG(level, tag, x) \
    do { \
        if (::featureminer::logging::isEnabled(level)) { \
            std::clog << tag << x << std::endl; \
        } \
    } while (0)

#define LOG_WARNING(x) FEATUREMINER_LOG(::featureminer::logging::Level::Warning, "[warning] ", x)
#define LOG_INFO(x)    FEATUREMINER_LOG(::featureminer::logging::Level::Info, "[info] ", x)

#ifndef NDEBUG
#define DEBUG_PRINT(x) FEATUREMINER_LOG(::featureminer::logging::Level::Debug, "[debug] ", x)
#else
#define DEBUG_PRINT(x) (void(0))
#endif

#endif //FEATUREMINER_LOGGING_HPP
