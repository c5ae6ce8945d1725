//
// Created by Matthew Krueger on 10/14/25.
//

#include "Instrumentation.hpp"

#include <cstdio>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace instrumentation {

    std::string jsonEscape(const std::string& toEscape) {
        std::string escaped;
        escaped.reserve(toEscape.size());

        for (const char currentChar : toEscape) {
            switch (currentChar) {
                case '"':  escaped += "\\\""; break;
                case '\\': escaped += "\\\\"; break;
                case '\n': escaped += "\\n"; break;
                case '\t': escaped += "\\t"; break;
                case '\r': escaped += "\\r"; break;
                default:
                    if (static_cast<unsigned char>(currentChar) < 0x20) {
                        char buffer[8];
                        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(currentChar));
                        escaped += buffer;
                    } else {
                        escaped += currentChar;
                    }
            }
        }

        return escaped;
    }

    Entry::Entry(const ProfileResult& result) {
        std::ostringstream oss;
        oss << "{";
        oss << R"("cat":"function",)";
        oss << "\"dur\":" << (result.end - result.start) << ',';
        oss << R"("name":")" << jsonEscape(result.name) << "\",";
        oss << R"("ph":"X",)";
        oss << "\"pid\":" << result.processID << ",";
        oss << "\"tid\":" << result.threadID << ",";
        oss << "\"ts\":" << result.start;
        oss << "}";

        m_Value = oss.str();
    }

    uint32_t Writer::getThreadID() {
        return static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    }

    TraceFileWriter::TraceFileWriter(const std::string& fileName, size_t targetBufferSize)
        : Writer(targetBufferSize), m_File(fileName, std::ios::out | std::ios::trunc) {
        if (!m_File.is_open()) {
            throw std::runtime_error("Could not open profile output file: " + fileName);
        }
        m_File << "[\n";
    }

    TraceFileWriter::~TraceFileWriter() {
        m_File << "\n]";
        m_File.close();
    }

    void TraceFileWriter::write(const std::vector<Entry>& entries) {
        for (const auto& entry : entries) {
            if (entry.to_string().empty()) {
                continue;
            }
            if (!m_IsFirstEntry) {
                m_File << ",\n";
            }
            m_File << entry;
            m_IsFirstEntry = false;
        }
    }

    void TraceFileWriter::flush() {
        m_File.flush();
    }

    std::shared_ptr<Instrumentor> Instrumentor::s_GlobalInstrumentor = nullptr;

    std::weak_ptr<Instrumentor> Instrumentor::getGlobalInstrumentor() {
        return Instrumentor::s_GlobalInstrumentor;
    }

    Instrumentor::Instrumentor(std::unique_ptr<Writer> &&writer) : m_Writer(std::move(writer)) {
        if (!m_Writer) {
            throw std::invalid_argument("Instrumentor requires a writer");
        }
    }

    void Instrumentor::recordEntry(Entry &&entry) {
        std::lock_guard lock(m_Mutex);
        m_LocalLog.push_back(std::move(entry));

        if (m_LocalLog.size() > m_Writer->getTargetBufferSize()) {
            flushLocked();
        }
    }

    Instrumentor::~Instrumentor() {
        flush();
        m_Writer->flush();
    }

    void Instrumentor::flush() {
        std::lock_guard lock(m_Mutex);
        flushLocked();
    }

    void Instrumentor::flushLocked() {
        m_Writer->write(m_LocalLog);
        m_LocalLog.clear();
    }

    void Instrumentor::initializeGlobalInstrumentor(std::unique_ptr<Writer> &&writer) {
        if (s_GlobalInstrumentor == nullptr) {
            s_GlobalInstrumentor = std::make_shared<Instrumentor>(std::move(writer));
        } else {
            std::clog << "Global Instrumentor already exists. Ignoring request." << std::endl;
        }
    }

    void Instrumentor::finalizeGlobalInstrumentor() {
        s_GlobalInstrumentor.reset(); // invalidate *all* instances of this instrumentor
    }

    void Session::stop() {
        if (!m_Stopped) {
            long long end = toMicroseconds(std::chrono::steady_clock::now());

            if (auto instrumentor = Instrumentor::getGlobalInstrumentor().lock()) {
                uint32_t threadID = instrumentor->getWriter()->getThreadID();
                uint32_t processID = instrumentor->getWriter()->getProcessID();
                instrumentor->recordEntry(Entry::ProfileResult{m_Name, toMicroseconds(m_StartTime), end, threadID, processID});
            }

            m_Stopped = true;
        }
    }

}
