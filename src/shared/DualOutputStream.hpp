//
// Created by Matthew Krueger on 10/17/25.
//

#ifndef FEATUREMINER_DUALOUTPUTSTREAM_HPP
#define FEATUREMINER_DUALOUTPUTSTREAM_HPP

#include <fstream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

/**
 * @brief Writes everything to a primary stream and, when a file name is given, to that file as well.
 */
class DualStream {
public:
    inline DualStream(std::ostream &output, const std::optional<std::string>& filename) : m_Output(output) {
        if (filename.has_value() && !filename->empty()) {
            m_File.open(*filename, std::ios::out | std::ios::trunc);
            if (!m_File.is_open()) {
                throw std::runtime_error("Could not open file: " + *filename);
            }
        }
    }

    inline ~DualStream() {
        if (m_File.is_open()) {
            m_File.close();
        }
    }

    DualStream(const DualStream&) = delete;
    DualStream& operator=(const DualStream&) = delete;

    template<typename T>
    DualStream& operator<<(const T& val) {
        m_Output << val;
        if (m_File.is_open())
            m_File << val;
        return *this;
    }

    // Overload for manipulators like std::endl
    DualStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(m_Output);
        if (m_File.is_open())
            manip(m_File);
        return *this;
    }

    [[nodiscard]] inline bool good() const {
        return m_Output.good() && (!m_File.is_open() || m_File.good());
    }

private:
    std::ostream &m_Output;
    std::ofstream m_File;

};

#endif //FEATUREMINER_DUALOUTPUTSTREAM_HPP
