//
// Created by igor on 15/08/2025.
//

#include <pngstash/png.hh>
#include <pngstash/chunk_iterator.hh>
#include <pngstash/exceptions.hh>

#include <algorithm>
#include <ostream>
#include <utility>

namespace pngstash {

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {}

    png png::parse(const void* data, std::size_t size, const parse_options& options) {
        chunk_iterator it(data, size, options);

        // Collected locally so that a failing frame leaves nothing behind
        std::vector<chunk> chunks;
        while (it.has_next()) {
            chunks.push_back(std::move(it.current().value));
            it.next();
        }
        return png(std::move(chunks));
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view type_text) {
        auto type = chunk_type::from_text(type_text);

        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [&type](const chunk& c) {
            return c.type() == type;
        });
        if (it == m_chunks.end()) {
            THROW_LOOKUP("No chunk of type '", type, "' found");
        }

        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::find_chunk(const chunk_type& type) const {
        for (const auto& c : m_chunks) {
            if (c.type() == type) {
                return &c;
            }
        }
        return nullptr;
    }

    std::vector<const chunk*> png::chunks_by_type(const chunk_type& type) const {
        std::vector<const chunk*> result;
        for (const auto& c : m_chunks) {
            if (c.type() == type) {
                result.push_back(&c);
            }
        }
        return result;
    }

    byte_buffer png::serialize() const {
        std::size_t total = standard_header.size();
        for (const auto& c : m_chunks) {
            total += c.frame_size();
        }

        byte_buffer out;
        out.reserve(total);
        for (auto b : standard_header) {
            out.push_back(std::byte(b));
        }
        for (const auto& c : m_chunks) {
            c.serialize_to(out);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG with " << p.chunks().size() << " chunk(s)\n";
        std::size_t index = 0;
        for (const auto& c : p.chunks()) {
            os << "\n#" << index++ << "\n" << c;
        }
        return os;
    }

} // namespace pngstash
