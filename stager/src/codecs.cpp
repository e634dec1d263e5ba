#include "tierstage/stager/codecs.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

#include "tierstage/stager/errors.hpp"

namespace tierstage::stager
{

    namespace
    {
        constexpr char kNpyMagic[] = "\x93NUMPY";
        constexpr std::size_t kNpyMagicSize = 6;
        constexpr std::size_t kNpyAlignment = 64;

        [[noreturn]] void format_error(const std::filesystem::path &path, const std::string &message)
        {
            throw StagingError(tierstage::ErrorCode::FormatError, path.string() + ": " + message);
        }

        std::ifstream open_for_reading(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                format_error(path, "cannot open for reading");
            }
            return in;
        }

        std::ofstream open_for_writing(const std::filesystem::path &path)
        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                format_error(path, "cannot open for writing");
            }
            return out;
        }

        void finish_write(std::ofstream &out, const std::filesystem::path &path)
        {
            out.flush();
            if (!out)
            {
                format_error(path, "write failed");
            }
        }

        std::size_t element_count(const std::filesystem::path &path, const std::vector<std::size_t> &shape)
        {
            std::size_t count = 1;
            for (const auto dim : shape)
            {
                if (dim != 0 && count > std::numeric_limits<std::size_t>::max() / dim)
                {
                    format_error(path, "shape is too large");
                }
                count *= dim;
            }
            return count;
        }

        std::string shape_literal(const std::vector<std::size_t> &shape)
        {
            std::string text = "(";
            for (std::size_t i = 0; i < shape.size(); ++i)
            {
                if (i > 0)
                {
                    text += ", ";
                }
                text += std::to_string(shape[i]);
            }
            if (shape.size() == 1)
            {
                text += ',';
            }
            text += ')';
            return text;
        }

        template <typename T>
        T from_little_endian(const char *bytes)
        {
            std::array<char, sizeof(T)> buffer{};
            std::memcpy(buffer.data(), bytes, sizeof(T));
            if constexpr (std::endian::native == std::endian::big)
            {
                std::reverse(buffer.begin(), buffer.end());
            }
            T value{};
            std::memcpy(&value, buffer.data(), sizeof(T));
            return value;
        }

        template <typename T>
        void append_little_endian(std::string &out, T value)
        {
            std::array<char, sizeof(T)> buffer{};
            std::memcpy(buffer.data(), &value, sizeof(T));
            if constexpr (std::endian::native == std::endian::big)
            {
                std::reverse(buffer.begin(), buffer.end());
            }
            out.append(buffer.data(), buffer.size());
        }

        std::string header_value(const std::string &header, const std::string &key)
        {
            const auto key_pos = header.find("'" + key + "'");
            if (key_pos == std::string::npos)
            {
                return {};
            }
            const auto colon = header.find(':', key_pos);
            if (colon == std::string::npos)
            {
                return {};
            }
            auto begin = header.find_first_not_of(' ', colon + 1);
            if (begin == std::string::npos)
            {
                return {};
            }
            if (header[begin] == '\'')
            {
                const auto end = header.find('\'', begin + 1);
                return end == std::string::npos ? std::string{} : header.substr(begin + 1, end - begin - 1);
            }
            if (header[begin] == '(')
            {
                const auto end = header.find(')', begin);
                return end == std::string::npos ? std::string{} : header.substr(begin, end - begin + 1);
            }
            const auto end = header.find_first_of(",}", begin);
            return header.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
        }

        std::vector<std::size_t> parse_shape(const std::filesystem::path &path, const std::string &literal)
        {
            if (literal.size() < 2 || literal.front() != '(' || literal.back() != ')')
            {
                format_error(path, "malformed shape " + literal);
            }
            std::vector<std::size_t> shape;
            std::string token;
            std::istringstream stream(literal.substr(1, literal.size() - 2));
            while (std::getline(stream, token, ','))
            {
                token.erase(std::remove(token.begin(), token.end(), ' '), token.end());
                if (token.empty())
                {
                    continue;
                }
                if (!std::all_of(token.begin(), token.end(), [](unsigned char ch)
                                 { return std::isdigit(ch) != 0; }))
                {
                    format_error(path, "malformed shape " + literal);
                }
                try
                {
                    shape.push_back(static_cast<std::size_t>(std::stoull(token)));
                }
                catch (const std::exception &)
                {
                    format_error(path, "malformed shape " + literal);
                }
            }
            return shape;
        }

        std::string quote_field(const std::string &field, char separator)
        {
            if (field.find_first_of(std::string{separator, '"', '\n', '\r'}) == std::string::npos)
            {
                return field;
            }
            std::string quoted = "\"";
            for (const char ch : field)
            {
                if (ch == '"')
                {
                    quoted += '"';
                }
                quoted += ch;
            }
            quoted += '"';
            return quoted;
        }

    } // namespace

    std::string TextCodec::load(const std::filesystem::path &path) const
    {
        auto in = open_for_reading(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void TextCodec::save(const std::filesystem::path &path, const std::string &value) const
    {
        auto out = open_for_writing(path);
        out << value;
        finish_write(out, path);
    }

    nlohmann::json JsonCodec::load(const std::filesystem::path &path) const
    {
        auto in = open_for_reading(path);
        try
        {
            nlohmann::json json;
            in >> json;
            return json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            format_error(path, ex.what());
        }
    }

    void JsonCodec::save(const std::filesystem::path &path, const nlohmann::json &value) const
    {
        auto out = open_for_writing(path);
        out << value.dump(indent_);
        finish_write(out, path);
    }

    Table CsvCodec::load(const std::filesystem::path &path) const
    {
        auto in = open_for_reading(path);
        const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        Table table;
        std::vector<std::string> row;
        std::string field;
        bool in_quotes = false;
        bool row_has_content = false;

        for (std::size_t i = 0; i < text.size(); ++i)
        {
            const char ch = text[i];
            if (in_quotes)
            {
                if (ch == '"')
                {
                    if (i + 1 < text.size() && text[i + 1] == '"')
                    {
                        field += '"';
                        ++i;
                    }
                    else
                    {
                        in_quotes = false;
                    }
                }
                else
                {
                    field += ch;
                }
                continue;
            }

            if (ch == '"')
            {
                in_quotes = true;
                row_has_content = true;
            }
            else if (ch == separator_)
            {
                row.push_back(std::move(field));
                field.clear();
                row_has_content = true;
            }
            else if (ch == '\n' || ch == '\r')
            {
                if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                {
                    ++i;
                }
                if (row_has_content || !field.empty())
                {
                    row.push_back(std::move(field));
                    table.push_back(std::move(row));
                }
                row.clear();
                field.clear();
                row_has_content = false;
            }
            else
            {
                field += ch;
                row_has_content = true;
            }
        }

        if (in_quotes)
        {
            format_error(path, "unterminated quoted field");
        }
        if (row_has_content || !field.empty())
        {
            row.push_back(std::move(field));
            table.push_back(std::move(row));
        }
        return table;
    }

    void CsvCodec::save(const std::filesystem::path &path, const Table &value) const
    {
        auto out = open_for_writing(path);
        for (const auto &row : value)
        {
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                if (i > 0)
                {
                    out << separator_;
                }
                out << quote_field(row[i], separator_);
            }
            out << '\n';
        }
        finish_write(out, path);
    }

    NdArray NpyCodec::load(const std::filesystem::path &path) const
    {
        auto in = open_for_reading(path);
        const std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (bytes.size() < kNpyMagicSize + 4 || bytes.compare(0, kNpyMagicSize, kNpyMagic, kNpyMagicSize) != 0)
        {
            format_error(path, "not an npy file");
        }

        const auto major = static_cast<unsigned char>(bytes[kNpyMagicSize]);
        std::size_t header_length = 0;
        std::size_t header_offset = 0;
        if (major == 1)
        {
            header_length = from_little_endian<std::uint16_t>(bytes.data() + kNpyMagicSize + 2);
            header_offset = kNpyMagicSize + 4;
        }
        else if (major == 2 || major == 3)
        {
            if (bytes.size() < kNpyMagicSize + 6)
            {
                format_error(path, "truncated header");
            }
            header_length = from_little_endian<std::uint32_t>(bytes.data() + kNpyMagicSize + 2);
            header_offset = kNpyMagicSize + 6;
        }
        else
        {
            format_error(path, "unsupported npy version " + std::to_string(major));
        }
        if (bytes.size() < header_offset + header_length)
        {
            format_error(path, "truncated header");
        }

        const auto header = bytes.substr(header_offset, header_length);
        const auto descr = header_value(header, "descr");
        if (header_value(header, "fortran_order") == "True")
        {
            format_error(path, "fortran ordered arrays are not supported");
        }

        NdArray array;
        array.shape = parse_shape(path, header_value(header, "shape"));
        const auto count = element_count(path, array.shape);

        std::size_t item_size = 0;
        if (descr == "<f8" || descr == "<i8")
        {
            item_size = 8;
        }
        else if (descr == "<f4" || descr == "<i4")
        {
            item_size = 4;
        }
        else
        {
            format_error(path, "unsupported dtype '" + descr + "'");
        }

        const auto data_offset = header_offset + header_length;
        if (count > (bytes.size() - data_offset) / item_size)
        {
            format_error(path, "truncated data");
        }

        array.data.reserve(count);
        const char *cursor = bytes.data() + data_offset;
        for (std::size_t i = 0; i < count; ++i, cursor += item_size)
        {
            if (descr == "<f8")
            {
                array.data.push_back(from_little_endian<double>(cursor));
            }
            else if (descr == "<f4")
            {
                array.data.push_back(static_cast<double>(from_little_endian<float>(cursor)));
            }
            else if (descr == "<i8")
            {
                array.data.push_back(static_cast<double>(from_little_endian<std::int64_t>(cursor)));
            }
            else
            {
                array.data.push_back(static_cast<double>(from_little_endian<std::int32_t>(cursor)));
            }
        }
        return array;
    }

    void NpyCodec::save(const std::filesystem::path &path, const NdArray &value) const
    {
        if (element_count(path, value.shape) != value.data.size())
        {
            format_error(path, "shape " + shape_literal(value.shape) + " does not match " +
                                   std::to_string(value.data.size()) + " elements");
        }

        std::string header = "{'descr': '<f8', 'fortran_order': False, 'shape': " + shape_literal(value.shape) + ", }";
        const auto preamble = kNpyMagicSize + 4;
        const auto unpadded = preamble + header.size() + 1;
        header.append((kNpyAlignment - unpadded % kNpyAlignment) % kNpyAlignment, ' ');
        header += '\n';

        std::string bytes(kNpyMagic, kNpyMagicSize);
        bytes += '\x01';
        bytes += '\x00';
        append_little_endian(bytes, static_cast<std::uint16_t>(header.size()));
        bytes += header;
        for (const double item : value.data)
        {
            append_little_endian(bytes, item);
        }

        auto out = open_for_writing(path);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        finish_write(out, path);
    }

} // namespace tierstage::stager
