/**
 * @file disk_queue.hpp
 * @brief File backed @ref BackendQueue.
 *
 * Records are appended to a sequence of numbered files
 * `<data_path>/<name>.diskqueue.<NNNNNN>.dat`, each record framed as a
 * big‑endian uint32 length followed by the payload.  A new file is started
 * once the current one reaches `max_bytes_per_file`; files are deleted as
 * soon as they have been read completely.
 *
 * Read/write positions and the depth live in
 * `<data_path>/<name>.diskqueue.meta.dat`, written on rotation and on
 * close and loaded again on construction, so a queue reopened under the same
 * name resumes where the previous instance stopped.
 */

#pragma once

#include <msgbroker/backend_queue.hpp>
#include <msgbroker/errors.hpp>
#include <msgbroker/logging.hpp>

#include <boost/endian/conversion.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace msgbroker {

struct DiskQueueOptions {
    std::string name;
    std::string data_path = ".";
    std::int64_t max_bytes_per_file = 100 * 1024 * 1024;
    std::uint32_t max_message_size = 1024 * 1024;

    void validate() const {
        if (name.empty()) {
            throw std::invalid_argument("disk queue name must not be empty");
        }
        if (max_bytes_per_file <= 0) {
            throw std::invalid_argument("max_bytes_per_file must be positive");
        }
        if (max_message_size == 0) {
            throw std::invalid_argument("max_message_size must be positive");
        }
    }
};

class DiskQueue : public BackendQueue {
  private:
    static constexpr std::int64_t frame_header_size = 4;

    const DiskQueueOptions m_options;
    mutable std::mutex m_mutex;

    std::int64_t m_read_file_num{0};
    std::int64_t m_read_pos{0};
    std::int64_t m_write_file_num{0};
    std::int64_t m_write_pos{0};
    std::int64_t m_depth{0};

    std::ofstream m_writer;
    std::ifstream m_reader;
    bool m_closed{false};

    logging::Logger m_logger;

    std::filesystem::path file_name(std::int64_t file_num) const {
        std::ostringstream name;
        name << m_options.name << ".diskqueue." << std::setw(6)
             << std::setfill('0') << file_num << ".dat";
        return std::filesystem::path(m_options.data_path) / name.str();
    }

    std::filesystem::path meta_file_name() const {
        return std::filesystem::path(m_options.data_path) /
               (m_options.name + ".diskqueue.meta.dat");
    }

    void retrieve_meta_data() {
        const auto path = meta_file_name();
        if (!std::filesystem::exists(path)) {
            return;
        }
        std::ifstream in(path);
        char sep1 = 0;
        char sep2 = 0;
        in >> m_depth >> m_read_file_num >> sep1 >> m_read_pos >>
            m_write_file_num >> sep2 >> m_write_pos;
        if (!in || sep1 != ',' || sep2 != ',') {
            throw backend_error("corrupt metadata file " + path.string());
        }
        MSGBROKER_LOG_INFO(m_logger,
                           "DISKQUEUE({}): resumed depth={} read={}:{} "
                           "write={}:{}",
                           m_options.name, m_depth, m_read_file_num,
                           m_read_pos, m_write_file_num, m_write_pos);
    }

    // Caller holds m_mutex.
    void persist_meta_data_no_lock() {
        const auto path = meta_file_name();
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            out << m_depth << "\n"
                << m_read_file_num << "," << m_read_pos << "\n"
                << m_write_file_num << "," << m_write_pos << "\n";
            out.flush();
            if (!out) {
                throw backend_error("failed to write metadata " + tmp.string());
            }
        }
        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            throw backend_error("failed to rename metadata " + tmp.string() +
                                ": " + ec.message());
        }
    }

    // Caller holds m_mutex.
    void open_writer_no_lock() {
        const auto path = file_name(m_write_file_num);
        std::error_code ec;
        if (std::filesystem::exists(path, ec) &&
            static_cast<std::int64_t>(std::filesystem::file_size(path, ec)) >
                m_write_pos) {
            // Drop bytes written after the last persisted position.
            std::filesystem::resize_file(path, m_write_pos, ec);
            if (ec) {
                throw backend_error("failed to truncate " + path.string() +
                                    ": " + ec.message());
            }
        }
        m_writer.open(path, std::ios::binary | std::ios::app);
        if (!m_writer) {
            throw backend_error("failed to open " + path.string());
        }
    }

    // Caller holds m_mutex. A metadata failure is only logged; the next
    // rotation or close() writes it again.
    void rotate_writer_no_lock() {
        m_writer.close();
        ++m_write_file_num;
        m_write_pos = 0;
        try {
            persist_meta_data_no_lock();
        } catch (const backend_error& e) {
            MSGBROKER_LOG_ERROR(m_logger, "DISKQUEUE({}): rotation - {}",
                                m_options.name, e.what());
        }
    }

    // Caller holds m_mutex. Walks the frame headers between the read and
    // write positions.
    std::int64_t count_records_no_lock() const {
        std::int64_t count = 0;
        for (auto num = m_read_file_num; num <= m_write_file_num; ++num) {
            const auto path = file_name(num);
            std::int64_t end = m_write_pos;
            if (num < m_write_file_num) {
                std::error_code ec;
                end = static_cast<std::int64_t>(
                    std::filesystem::file_size(path, ec));
                if (ec) {
                    continue;
                }
            }
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                continue;
            }
            std::int64_t pos = num == m_read_file_num ? m_read_pos : 0;
            unsigned char header[frame_header_size];
            while (pos + frame_header_size <= end) {
                in.seekg(pos);
                if (!in.read(reinterpret_cast<char*>(header), sizeof(header))) {
                    break;
                }
                const std::uint32_t size = boost::endian::load_big_u32(header);
                if (size == 0 || size > m_options.max_message_size) {
                    break;
                }
                pos += frame_header_size + size;
                ++count;
            }
        }
        return count;
    }

    // Caller holds m_mutex. Moves the read side to the next file.
    void advance_read_file_no_lock(bool remove_file) {
        m_reader.close();
        const auto path = file_name(m_read_file_num);
        if (remove_file) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec) {
                MSGBROKER_LOG_ERROR(m_logger,
                                    "DISKQUEUE({}): failed to remove {} - {}",
                                    m_options.name, path.string(),
                                    ec.message());
            }
        }
        ++m_read_file_num;
        m_read_pos = 0;
    }

    // Caller holds m_mutex.
    void handle_read_error_no_lock(const std::string& what) {
        const auto path = file_name(m_read_file_num);
        auto bad = path;
        bad += ".bad";
        MSGBROKER_LOG_ERROR(m_logger,
                            "DISKQUEUE({}): {} in {} - moving to {}",
                            m_options.name, what, path.string(), bad.string());
        if (m_read_file_num == m_write_file_num) {
            rotate_writer_no_lock();
        }
        advance_read_file_no_lock(false);
        std::error_code ec;
        std::filesystem::rename(path, bad, ec);
        if (ec) {
            MSGBROKER_LOG_ERROR(m_logger,
                                "DISKQUEUE({}): failed to rename {} - {}",
                                m_options.name, path.string(), ec.message());
        }
        // Records left in the abandoned file are gone.
        m_depth = count_records_no_lock();
        throw backend_error(what + " in " + path.string());
    }

    bool empty_no_lock() const {
        return m_read_file_num == m_write_file_num &&
               m_read_pos == m_write_pos;
    }

  public:
    explicit DiskQueue(DiskQueueOptions options)
        : m_options(std::move(options)),
          m_logger(logging::create_logger("diskqueue-" + m_options.name)) {
        m_options.validate();
        std::error_code ec;
        std::filesystem::create_directories(m_options.data_path, ec);
        if (ec) {
            throw backend_error("failed to create " + m_options.data_path +
                                ": " + ec.message());
        }
        retrieve_meta_data();
    }

    DiskQueue(const std::string& name, const std::string& data_path,
              std::int64_t max_bytes_per_file)
        : DiskQueue(DiskQueueOptions{name, data_path, max_bytes_per_file}) {}

    DiskQueue(const DiskQueue&) = delete;
    DiskQueue& operator=(const DiskQueue&) = delete;

    ~DiskQueue() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_writer.close();
        m_reader.close();
        try {
            persist_meta_data_no_lock();
        } catch (const backend_error& e) {
            MSGBROKER_LOG_ERROR(m_logger, "DISKQUEUE({}): {}", m_options.name,
                                e.what());
        }
    }

    const DiskQueueOptions& options() const { return m_options; }

    void put(const Bytes& data) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw backend_error("disk queue " + m_options.name + " is closed");
        }
        if (data.empty() || data.size() > m_options.max_message_size) {
            throw backend_error("invalid message size " +
                                std::to_string(data.size()));
        }
        if (!m_writer.is_open()) {
            open_writer_no_lock();
        }

        unsigned char header[frame_header_size];
        boost::endian::store_big_u32(header,
                                     static_cast<std::uint32_t>(data.size()));
        m_writer.write(reinterpret_cast<const char*>(header), sizeof(header));
        m_writer.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
        m_writer.flush();
        if (!m_writer) {
            m_writer.close();
            throw backend_error("failed to write to " +
                                file_name(m_write_file_num).string());
        }

        m_write_pos += frame_header_size + static_cast<std::int64_t>(data.size());
        ++m_depth;

        if (m_write_pos >= m_options.max_bytes_per_file) {
            rotate_writer_no_lock();
        }
    }

    std::optional<Bytes> try_receive() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw backend_error("disk queue " + m_options.name + " is closed");
        }

        while (!empty_no_lock()) {
            if (m_read_file_num < m_write_file_num) {
                std::error_code ec;
                const auto size = std::filesystem::file_size(
                    file_name(m_read_file_num), ec);
                if (ec || m_read_pos >= static_cast<std::int64_t>(size)) {
                    advance_read_file_no_lock(true);
                    continue;
                }
            }

            if (!m_reader.is_open()) {
                m_reader.open(file_name(m_read_file_num), std::ios::binary);
                if (!m_reader) {
                    handle_read_error_no_lock("failed to open");
                }
            }
            m_reader.clear();
            m_reader.seekg(m_read_pos);

            unsigned char header[frame_header_size];
            if (!m_reader.read(reinterpret_cast<char*>(header),
                               sizeof(header))) {
                handle_read_error_no_lock("truncated record header");
            }
            const std::uint32_t size = boost::endian::load_big_u32(header);
            if (size == 0 || size > m_options.max_message_size) {
                handle_read_error_no_lock("invalid record size " +
                                          std::to_string(size));
            }
            Bytes data(size);
            if (!m_reader.read(reinterpret_cast<char*>(data.data()), size)) {
                handle_read_error_no_lock("truncated record");
            }

            m_read_pos += frame_header_size + size;
            if (m_depth > 0) {
                --m_depth;
            }
            return data;
        }

        m_depth = 0;
        return std::nullopt;
    }

    std::int64_t depth() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_depth;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw backend_error("disk queue " + m_options.name +
                                " already closed");
        }
        m_closed = true;
        MSGBROKER_LOG_INFO(m_logger, "DISKQUEUE({}): closing", m_options.name);
        m_writer.close();
        m_reader.close();
        persist_meta_data_no_lock();
    }
};

} // namespace msgbroker
