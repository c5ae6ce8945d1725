//
// Created by Matthew Krueger on 10/14/25.
//

#ifndef FEATUREMINER_INSTRUMENTATION_HPP
#define FEATUREMINER_INSTRUMENTATION_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace instrumentation {

    /**
     * @brief Escapes a string for use inside a JSON string literal.
     */
    std::string jsonEscape(const std::string& toEscape);

    class Entry {
    public:
        struct ProfileResult {
            const char* name;
            long long start, end;
            uint32_t threadID;
            uint32_t processID;
        };

        /**
         * @brief A wrapper for a string representing a log entry.
         *
         * @param value A serialized version of the log entry. For Chrome trace logs, this is one event object without a trailing comma.
         */
        explicit Entry(std::string value) : m_Value(std::move(value)) {};
        Entry(const ProfileResult& result); // NOLINT(*-explicit-constructor)

        Entry(Entry&& other) noexcept = default;
        Entry(const Entry& other) = default;
        ~Entry() = default;

        Entry& operator=(const Entry&) = default;
        Entry& operator=(Entry&&) = default;

        [[nodiscard]] inline const std::string& to_string() const { return m_Value; };

        friend std::ostream& operator<<(std::ostream& os, const Entry& entry) { os << entry.m_Value; return os; }

    private:
        std::string m_Value;
    };

    class Writer {
    public:

        explicit Writer(size_t targetBufferSize) : m_TargetBufferSize(targetBufferSize) {};
        virtual ~Writer() = default;

        virtual void write(const std::vector<Entry>& entries) = 0;
        virtual uint32_t getThreadID();
        virtual uint32_t getProcessID() { return 0; }

        /**
         * @brief Pushes everything written so far to the destination.
         */
        virtual void flush() = 0;

        [[nodiscard]] inline size_t getTargetBufferSize() const { return m_TargetBufferSize; }

    private:
        size_t m_TargetBufferSize;

    };

    /**
     * @brief Writes entries as a Chrome trace (chrome://tracing, Perfetto) JSON array.
     */
    class TraceFileWriter final : public Writer {
    public:
        TraceFileWriter(const std::string& fileName, size_t targetBufferSize);
        ~TraceFileWriter() override;

        void write(const std::vector<Entry>& entries) override;
        void flush() override;

    private:
        std::ofstream m_File;
        bool m_IsFirstEntry = true;
    };

    class Instrumentor {
    public:
        explicit Instrumentor(std::unique_ptr<Writer>&& writer);
        Instrumentor(const Instrumentor&) = delete;
        Instrumentor(Instrumentor &&) = delete;
        ~Instrumentor();

        Instrumentor& operator=(const Instrumentor&) = delete;
        Instrumentor& operator=(Instrumentor&&) = delete;

        /**
         * @brief Buffers an entry. Safe to call from several threads at once.
         */
        void recordEntry(Entry&& entry);
        void flush();
        std::unique_ptr<Writer>& getWriter() { return m_Writer; }

        static std::weak_ptr<Instrumentor> getGlobalInstrumentor();
        static void initializeGlobalInstrumentor(std::unique_ptr<Writer>&& writer);
        static void finalizeGlobalInstrumentor();

    private:
        void flushLocked();

        static std::shared_ptr<Instrumentor> s_GlobalInstrumentor;

        std::unique_ptr<Writer> m_Writer;
        std::vector<Entry> m_LocalLog;
        std::mutex m_Mutex;

    };

    class Session {
    public:
        inline explicit Session(const char* name) : m_Name(name), m_StartTime(std::chrono::steady_clock::now()), m_Stopped(false) {};
        ~Session() {
            stop();
        };

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        void stop();

    private:
        static long long toMicroseconds(std::chrono::steady_clock::time_point timePoint) {
            return std::chrono::time_point_cast<std::chrono::microseconds>(timePoint).time_since_epoch().count();
        }

        const char* m_Name;
        std::chrono::steady_clock::time_point m_StartTime;
        bool m_Stopped;

    };

}

#define __PROFILE_CONCAT_INNER(a, b) a##b
#define __PROFILE_CONCAT(a, b) __PROFILE_CONCAT_INNER(a, b)

#ifdef BUILD_WITH_PROFILING
#ifdef __GNUC__
#define __PROFILE_FUNCTION_NAME                    __PRETTY_FUNCTION__
#else
#define __PROFILE_FUNCTION_NAME                    __FUNCSIG__
#endif
#define PROFILE_BEGIN_SESSION(writer)             ::instrumentation::Instrumentor::initializeGlobalInstrumentor(writer)
#define PROFILE_END_SESSION()                     ::instrumentation::Instrumentor::finalizeGlobalInstrumentor()
#define PROFILE_SCOPE(name)                       ::instrumentation::Session __PROFILE_CONCAT(session, __LINE__)(name)
#define PROFILE_FUNCTION()                        PROFILE_SCOPE(__PROFILE_FUNCTION_NAME)
#define PROFILING_ENABLED                         true
#else
#define PROFILE_BEGIN_SESSION(writer)             (void(0))
#define PROFILE_END_SESSION()                     (void(0))
#define PROFILE_FUNCTION()                        (void(0))
#define PROFILE_SCOPE(name)                       (void(0))
#define PROFILING_ENABLED                         false
#endif

#endif //FEATUREMINER_INSTRUMENTATION_HPP
