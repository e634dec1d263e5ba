#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tierstage::stager
{

    // Reads and writes one kind of data at an already accessible path.
    // FileStager only calls a codec after resolving or reserving the path.
    template <typename T>
    class Codec
    {
    public:
        using value_type = T;

        virtual ~Codec() = default;

        virtual T load(const std::filesystem::path &path) const = 0;
        virtual void save(const std::filesystem::path &path, const T &value) const = 0;
        virtual std::string_view name() const noexcept = 0;
    };

    class TextCodec : public Codec<std::string>
    {
    public:
        std::string load(const std::filesystem::path &path) const override;
        void save(const std::filesystem::path &path, const std::string &value) const override;
        std::string_view name() const noexcept override { return "text"; }
    };

    class JsonCodec : public Codec<nlohmann::json>
    {
    public:
        explicit JsonCodec(int indent = 2) : indent_(indent) {}

        nlohmann::json load(const std::filesystem::path &path) const override;
        void save(const std::filesystem::path &path, const nlohmann::json &value) const override;
        std::string_view name() const noexcept override { return "json"; }

    private:
        int indent_;
    };

    using Table = std::vector<std::vector<std::string>>;

    // Comma separated rows, quoting fields that contain separators, quotes or newlines.
    class CsvCodec : public Codec<Table>
    {
    public:
        explicit CsvCodec(char separator = ',') : separator_(separator) {}

        Table load(const std::filesystem::path &path) const override;
        void save(const std::filesystem::path &path, const Table &value) const override;
        std::string_view name() const noexcept override { return "csv"; }

    private:
        char separator_;
    };

    struct NdArray
    {
        std::vector<std::size_t> shape;
        std::vector<double> data;

        bool operator==(const NdArray &) const = default;
    };

    // NumPy .npy files in C order. Loads little-endian f8, f4, i8 and i4
    // arrays; always saves f8.
    class NpyCodec : public Codec<NdArray>
    {
    public:
        NdArray load(const std::filesystem::path &path) const override;
        void save(const std::filesystem::path &path, const NdArray &value) const override;
        std::string_view name() const noexcept override { return "npy"; }
    };

} // namespace tierstage::stager
