// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "tzif.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

#include "UtcTimeKit/calendar/Common.hpp"

using namespace UtcTimeKit::calendar::exception;

namespace UtcTimeKit::calendar::source::low_level {

	namespace {
		std::vector<uint8_t> readFile(const std::filesystem::path &path) {
			std::ifstream file(path, std::ios::binary | std::ios::ate);
			if (!file) { UTK_THROW(DataError, "cannot open " + path.string()); }

			const auto size = file.tellg();
			if (size <= 0) { UTK_THROW(DataError, path.string() + " is empty"); }

			std::vector<uint8_t> buffer(static_cast<size_t>(size));
			file.seekg(0);
			file.read(reinterpret_cast<char *>(buffer.data()), size);
			if (!file) { UTK_THROW(DataError, "failed to read " + path.string()); }
			return buffer;
		}

		struct Cursor {
			const std::vector<uint8_t> &data;
			size_t offset;
			const std::string &name;

			void need(size_t n) const {
				if (offset + n > data.size())
					UTK_THROW(DataError, "zone \"" + name + "\" is truncated");
			}
			uint8_t u8() {
				need(1);
				return data[offset++];
			}
			uint32_t u32() {
				need(4);
				uint32_t v = 0;
				for (size_t i = 0; i < 4; i++) v = (v << 8) | data[offset++];
				return v;
			}
			int64_t i64() {
				need(8);
				uint64_t v = 0;
				for (size_t i = 0; i < 8; i++) v = (v << 8) | data[offset++];
				return static_cast<int64_t>(v);
			}
			void skip(size_t n) {
				need(n);
				offset += n;
			}
		};

		struct Header {
			uint8_t version;
			uint32_t isutcnt, isstdcnt, leapcnt, timecnt, typecnt, charcnt;
		};

		Header readHeader(Cursor &in) {
			in.need(TzifReader::HEADER_SIZE);
			if (std::memcmp(in.data.data() + in.offset, TzifReader::TZIF_MAGIC, 4) != 0)
				UTK_THROW(DataError, "zone \"" + in.name + "\" is not a TZif file");
			in.skip(4);
			Header h{};
			h.version = in.u8();
			in.skip(15);
			h.isutcnt = in.u32();
			h.isstdcnt = in.u32();
			h.leapcnt = in.u32();
			h.timecnt = in.u32();
			h.typecnt = in.u32();
			h.charcnt = in.u32();
			if (h.typecnt == 0) UTK_THROW(DataError, "zone \"" + in.name + "\" has no types");
			return h;
		}

		// one data block; time_size is 4 for the version 1 block and 8 for later blocks
		TzifData readBlock(Cursor &in, const Header &h, size_t time_size) {
			TzifData out{};
			out.name = in.name;
			out.transitions.reserve(h.timecnt);
			for (uint32_t i = 0; i < h.timecnt; i++) {
				out.transitions.push_back(time_size == 8
											  ? in.i64()
											  : static_cast<int64_t>(static_cast<int32_t>(in.u32())));
			}
			out.transition_types.reserve(h.timecnt);
			for (uint32_t i = 0; i < h.timecnt; i++) {
				const uint8_t type = in.u8();
				if (type >= h.typecnt)
					UTK_THROW(DataError, "zone \"" + in.name + "\" has a bad type index");
				out.transition_types.push_back(type);
			}
			std::vector<uint8_t> designation_index(h.typecnt);
			out.types.resize(h.typecnt);
			for (uint32_t i = 0; i < h.typecnt; i++) {
				out.types[i].utoff = static_cast<int32_t>(in.u32());
				out.types[i].dst = in.u8() != 0;
				designation_index[i] = in.u8();
			}
			in.need(h.charcnt);
			const char *const chars = reinterpret_cast<const char *>(in.data.data() + in.offset);
			for (uint32_t i = 0; i < h.typecnt; i++) {
				if (designation_index[i] >= h.charcnt) continue;
				const size_t max_len = h.charcnt - designation_index[i];
				out.types[i].abbreviation =
					std::string(chars + designation_index[i],
								strnlen(chars + designation_index[i], max_len));
			}
			in.skip(h.charcnt);
			in.skip(static_cast<size_t>(h.leapcnt) * (time_size + 4));
			in.skip(h.isstdcnt);
			in.skip(h.isutcnt);
			if (!std::is_sorted(out.transitions.begin(), out.transitions.end()))
				UTK_THROW(DataError, "zone \"" + in.name + "\" has unordered transitions");
			return out;
		}
	} // namespace

	const TzifType &TzifData::type_at(int64_t seconds) const noexcept {
		if (transitions.empty() || seconds < transitions.front()) return types.front();
		const auto next = std::upper_bound(transitions.begin(), transitions.end(), seconds);
		const auto index = static_cast<size_t>(std::distance(transitions.begin(), next)) - 1;
		return types[transition_types[index]];
	}

	bool TzifReader::isTzifFile(const std::filesystem::path &path) {
		std::ifstream file(path, std::ios::binary);
		if (!file) { return false; }
		char magic[4] = {};
		file.read(magic, sizeof(magic));
		return file && std::memcmp(magic, TZIF_MAGIC, sizeof(magic)) == 0;
	}

	TzifData TzifReader::read(const std::filesystem::path &path, const std::string &name) {
		return parse(readFile(path), name);
	}

	TzifData TzifReader::parse(const std::vector<uint8_t> &data, const std::string &name) {
		Cursor in{data, 0, name};
		const Header first = readHeader(in);
		TzifData v1 = readBlock(in, first, 4);
		if (first.version < '2') return v1;

		const Header second = readHeader(in);
		TzifData v2 = readBlock(in, second, 8);
		if (in.offset < data.size() && data[in.offset] == '\n') {
			const auto begin = data.begin() + static_cast<std::ptrdiff_t>(in.offset) + 1;
			const auto end = std::find(begin, data.end(), '\n');
			v2.footer.assign(begin, end);
		}
		return v2;
	}

} // namespace UtcTimeKit::calendar::source::low_level
