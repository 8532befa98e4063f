#include "chiptlv/core/bytes.hpp"
#include "chiptlv/codec/errors.hpp"
#include "chiptlv/codec/dump.hpp"

#include "CLI11/CLI11.hpp"
#include "replxx.hxx"

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

namespace {
	using chiptlv::core::byte;
	using chiptlv::core::byte_buffer;
	using chiptlv::codec::tlv_error;

	constexpr int DEFAULT_INDENT = 2;

	int hex_digit(char ch) {
		if (ch >= '0' && ch <= '9') return ch - '0';
		if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
		if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
		return -1;
	}

	// Accepts "07 00 90", "0x07,0x00,0x90" and "070090".
	std::optional<byte_buffer> parse_hex(const std::string& text) {
		byte_buffer out;
		int high = -1;
		for (std::size_t i = 0; i < text.size(); ++i) {
			const char ch = text[i];
			if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
				if (high != -1) {
					return std::nullopt;
				}
				continue;
			}
			if (ch == '0' && high == -1 && i + 1 < text.size() && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
				++i;
				continue;
			}
			const int d = hex_digit(ch);
			if (d < 0) {
				return std::nullopt;
			}
			if (high == -1) {
				high = d;
			}
			else {
				out.push_back(static_cast<byte>((high << 4) | d));
				high = -1;
			}
		}
		if (high != -1) {
			return std::nullopt;
		}
		return out;
	}

	int dump_buffer(const byte_buffer& data, int indent) {
		try {
			chiptlv::codec::dump(std::cout, data, indent);
			return 0;
		}
		catch (const tlv_error& e) {
			std::cerr << "Error decoding TLV: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_decode(const std::string& hex, int indent) {
		auto data = parse_hex(hex);
		if (!data) {
			std::cerr << "Invalid hex input\n";
			return 1;
		}
		return dump_buffer(*data, indent);
	}

	int cmd_file(const std::string& path, int indent) {
		std::ifstream in(path, std::ios::binary);
		if (!in) {
			std::cerr << "Failed to open file: " << path << "\n";
			return 1;
		}
		const std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
		const auto view = chiptlv::core::as_bytes(raw);
		return dump_buffer(byte_buffer(view.begin(), view.end()), indent);
	}

	void cmd_help() {
		std::cout << "\ntlvtool shell commands:\n";
		std::cout << "  <hex bytes>     - Decode and dump TLV (e.g. 15 24 01 2A 29 02 18)\n";
		std::cout << "  file <path>     - Decode and dump a binary TLV file\n";
		std::cout << "  help            - Show this help\n";
		std::cout << "  exit/quit       - Exit shell\n\n";
	}
}

void shell_mode(int indent) {
	replxx::Replxx rx;
	rx.set_max_history_size(128);

	std::cout << "tlvtool shell\n";
	std::cout << "Type 'help' for commands, 'exit' to quit\n\n";

	while (true) {
		const char* input = rx.input("tlv> ");
		if (!input) break;

		std::string line(input);
		if (line.empty()) continue;
		if (line == "exit" || line == "quit") break;

		if (line == "help") {
			cmd_help();
		}
		else if (line.rfind("file ", 0) == 0) {
			cmd_file(line.substr(5), indent);
		}
		else {
			cmd_decode(line, indent);
		}

		rx.history_add(line);
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "tlvtool - TLV decoder and dumper" };

	int indent = DEFAULT_INDENT;
	app.add_option("-i,--indent", indent, "Indentation step for nested containers")
		->default_val(DEFAULT_INDENT)
		->check(CLI::Range(0, 16));

	app.require_subcommand(1);

	std::string hex;
	std::string path;
	int result = 0;

	auto decode_cmd = app.add_subcommand("decode", "Decode TLV given as hex bytes");
	decode_cmd->add_option("hex", hex, "Hex bytes, e.g. \"07 00 90 2F 50 09 00 00 00\"")->required();
	decode_cmd->callback([&]() {
		result = cmd_decode(hex, indent);
		});

	auto file_cmd = app.add_subcommand("file", "Decode a binary TLV file");
	file_cmd->add_option("path", path, "File with raw TLV bytes")->required()->check(CLI::ExistingFile);
	file_cmd->callback([&]() {
		result = cmd_file(path, indent);
		});

	auto shell_cmd = app.add_subcommand("shell", "Interactive shell mode");
	shell_cmd->callback([&]() {
		shell_mode(indent);
		});

	CLI11_PARSE(app, argc, argv);

	return result;
}
