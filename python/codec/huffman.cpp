#include "huffkit/codec/huffman.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "huffkit/codec/container.hpp"
#include "huffkit/codec/encoder.hpp"

namespace py = pybind11;
using namespace huffkit::codec;

namespace {

auto toBytes(const py::bytes& data) -> std::vector<u8> {
    std::string raw = data;
    return {raw.begin(), raw.end()};
}

auto toPyBytes(const std::vector<u8>& data) -> py::bytes {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace

PYBIND11_MODULE(huffman, m) {
    m.doc() = R"pbdoc(
        Huffman Compression
        -------------------

        Lossless compression of byte strings with a Huffman code built per
        call.

        ```python
        from huffkit.codec.huffman import compress, decompress, encode, decode

        payload, valid_bits, tree, stats = compress(b"ABAC")
        assert decompress(payload, valid_bits, tree) == b"ABAC"

        frame = encode(b"Hello, world!")
        assert decode(frame) == b"Hello, world!"
        ```
    )pbdoc";

    static py::exception<InvalidInputException> invalidInput(
        m, "InvalidInputError", PyExc_ValueError);
    static py::exception<MalformedPayloadException> malformedPayload(
        m, "MalformedPayloadError", PyExc_RuntimeError);
    static py::exception<UnsupportedSymbolException> unsupportedSymbol(
        m, "UnsupportedSymbolError", PyExc_KeyError);

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const InvalidInputException& e) {
            invalidInput(e.getMessage().c_str());
        } catch (const MalformedPayloadException& e) {
            malformedPayload(e.getMessage().c_str());
        } catch (const UnsupportedSymbolException& e) {
            unsupportedSymbol(e.getMessage().c_str());
        }
    });

    py::class_<TreeStats>(m, "TreeStats", "Shape of a Huffman tree")
        .def_readonly("height", &TreeStats::height)
        .def_readonly("leaf_count", &TreeStats::leafCount)
        .def_readonly("internal_count", &TreeStats::internalCount)
        .def_readonly("average_code_length", &TreeStats::averageCodeLength);

    py::class_<CompressionStats>(m, "CompressionStats",
                                 "Figures describing one compression")
        .def_readonly("symbol_count", &CompressionStats::symbolCount)
        .def_readonly("distinct_symbols", &CompressionStats::distinctSymbols)
        .def_readonly("original_bits", &CompressionStats::originalBits)
        .def_readonly("compressed_bits", &CompressionStats::compressedBits)
        .def_readonly("tree", &CompressionStats::tree)
        .def_property_readonly(
            "elapsed_ns",
            [](const CompressionStats& s) { return s.elapsed.count(); })
        .def("ratio", &CompressionStats::ratio)
        .def("saved_bits", &CompressionStats::savedBits)
        .def("compression_rate", &CompressionStats::compressionRate)
        .def("compression_factor", &CompressionStats::compressionFactor)
        .def("__repr__", [](const CompressionStats& s) {
            return "<CompressionStats symbols=" +
                   std::to_string(s.symbolCount) +
                   " compressed_bits=" + std::to_string(s.compressedBits) +
                   ">";
        });

    m.def(
        "compress",
        [](const py::bytes& data, bool verify) {
            CodecOptions options;
            options.verifyRoundTrip = verify;
            auto input = toBytes(data);
            CompressionResult result = compress(input, options);
            return py::make_tuple(toPyBytes(result.payload.bytes),
                                  result.payload.validBitsInLastByte,
                                  toPyBytes(result.tree), result.stats);
        },
        py::arg("data"), py::arg("verify") = false,
        R"pbdoc(
        Compress a byte string.

        Returns:
            (payload, valid_bits_in_last_byte, serialized_tree, stats)
        )pbdoc");

    m.def(
        "decompress",
        [](const py::bytes& payload, u8 validBits, const py::bytes& tree,
           std::optional<u64> expected) {
            CompressedPayload packed{toBytes(payload), validBits};
            auto treeBytes = toBytes(tree);
            return toPyBytes(decompress(packed, treeBytes, expected));
        },
        py::arg("payload"), py::arg("valid_bits"), py::arg("tree"),
        py::arg("expected_symbols") = py::none(),
        "Restore the bytes produced by compress()");

    m.def(
        "codes",
        [](const py::bytes& data) {
            auto input = toBytes(data);
            EncodeResult encoded = encode(input);
            py::dict codes;
            for (const auto& [symbol, code] : encoded.codebook.entries()) {
                codes[py::int_(symbol)] = toBitText(code);
            }
            return codes;
        },
        py::arg("data"), "Huffman code of every symbol in data, as bit text");

    m.def(
        "encode",
        [](const py::bytes& data) {
            auto input = toBytes(data);
            return toPyBytes(writeContainer(compress(input)));
        },
        py::arg("data"), "Compress data into a self-describing frame");

    m.def(
        "decode",
        [](const py::bytes& frame) {
            auto input = toBytes(frame);
            return toPyBytes(decompressContainer(input));
        },
        py::arg("frame"), "Restore the bytes of a frame built by encode()");
}
