#include <pngchunk/chunk_type.hh>

#include <ostream>

namespace pngchunk {

    chunk_type chunk_type::from_string(std::string_view text) {
        THROW_PNGCHUNK_IF(text.size() != 4, wrong_length, 4, text.size());
        return from_bytes(text.data());
    }

    std::string chunk_type::to_string() const {
        return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        // Validated types are always printable, no escaping needed
        return os << '\'' << t.to_string() << '\'';
    }

} // namespace pngchunk
