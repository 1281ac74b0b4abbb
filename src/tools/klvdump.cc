#include "openklv/build_info.h"
#include "openklv/console_format.h"
#include "openklv/klv.h"
#include "openklv/mapped_source.h"
#include "openklv/resource_policy.h"
#include "openklv/universal_set.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace openklv {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Locates KLV universal sets in files and prints their local sets.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print OpenKLV build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --key <hex>            16-byte universal key as 32 hex digits\n"
            "                         (default: MISB ST 0601 UAS Datalink LS)\n"
            "  --lenient              Skip malformed sets and keep scanning\n"
            "  --no-strict            Accept non-minimal BER/BER-OID encodings\n"
            "  --offsets-only         Print key offsets without decoding sets\n"
            "  --max-file-bytes N     Optional file mapping cap (default: 0=unlimited)\n"
            "  --max-sets N           Max universal sets per file\n"
            "  --max-entries N        Max triplets per local set\n"
            "  --max-value-bytes N    Max value length accepted per triplet\n"
            "  --max-bytes N          Max value bytes printed (default: 32, 0=all)\n",
            argv0 ? argv0 : "klvdump");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static void print_local_set(const ByteCursor& cursor, const LocalSet& set,
                                uint32_t max_bytes)
    {
        for (const auto& [tag, klv] : set) {
            std::string line;
            line.append("  tag=");
            append_tag(tag, &line);

            std::span<const std::byte> value;
            if (klv_value_span(cursor, klv, &value) != KlvStatus::Ok) {
                line.append(" <value out of range>");
                std::printf("%s\n", line.c_str());
                continue;
            }

            char buf[96];
            std::snprintf(buf, sizeof(buf), " len=%llu off=%llu hex=",
                          static_cast<unsigned long long>(klv.length),
                          static_cast<unsigned long long>(klv.value_offset));
            line.append(buf);
            append_hex_bytes(value, max_bytes, &line);

            std::string ascii;
            if (!value.empty() && append_ascii_preview(value, max_bytes, &ascii)) {
                line.append(" ascii=\"");
                line.append(ascii);
                line.push_back('"');
            }
            std::printf("%s\n", line.c_str());
        }
    }

}  // namespace
}  // namespace openklv

int
main(int argc, char** argv)
{
    using namespace openklv;

    bool show_build_info = true;
    bool offsets_only    = false;
    uint32_t max_bytes   = 32;
    UniversalKey key     = kUasDatalinkLocalSetKey;

    KlvResourcePolicy policy;
    UniversalSetOptions options;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--lenient") == 0) {
            options.skip_malformed = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--no-strict") == 0) {
            options.local_set.klv.encoding.strict = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--offsets-only") == 0) {
            offsets_only = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--key") == 0 && i + 1 < argc) {
            if (!parse_universal_key_hex(argv[i + 1], &key)) {
                std::fprintf(stderr, "invalid --key value (need 32 hex digits)\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-sets") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.universal_set_limits.max_sets)) {
                std::fprintf(stderr, "invalid --max-sets value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-entries") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.local_set_limits.max_entries)) {
                std::fprintf(stderr, "invalid --max-entries value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-value-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &policy.klv_limits.max_value_bytes)) {
                std::fprintf(stderr, "invalid --max-value-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &max_bytes)) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    apply_resource_policy(policy, &options);
    if (show_build_info) {
        print_build_info_header();
    }

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }

        MappedSource source;
        const SourceStatus st = source.open(path, policy.max_file_bytes);
        if (st != SourceStatus::Ok) {
            std::fprintf(stderr, "klvdump: failed to map `%s` (%s)\n", path,
                         source_status_name(st));
            exit_code = 1;
            continue;
        }

        std::printf("== %s\n", path);
        std::printf("size=%llu\n",
                    static_cast<unsigned long long>(source.size()));

        ByteCursor cursor = source.cursor();
        if (offsets_only) {
            std::vector<uint64_t> offsets;
            const UniversalSetResult r
                = find_universal_key_offsets(cursor, key, &offsets, options);
            std::printf("scan=%s found=%u skipped=%u\n",
                        klv_status_name(r.status), r.sets_found,
                        r.sets_skipped);
            for (size_t i = 0; i < offsets.size(); ++i) {
                std::printf("key[%zu] offset=%llu\n", i,
                            static_cast<unsigned long long>(offsets[i]));
            }
            if (r.status != KlvStatus::Ok) {
                std::fprintf(stderr, "klvdump: scan of `%s` failed: %s\n",
                             path, klv_status_name(r.status));
                exit_code = 1;
            }
            continue;
        }

        std::vector<UniversalSet> sets;
        const UniversalSetResult r = read_universal_sets(cursor, key, &sets,
                                                         options);
        std::printf("scan=%s sets=%u skipped=%u\n", klv_status_name(r.status),
                    r.sets_found, r.sets_skipped);
        for (size_t i = 0; i < sets.size(); ++i) {
            const UniversalSet& set = sets[i];
            std::printf("set[%zu] key_offset=%llu length=%llu triplets=%zu\n",
                        i, static_cast<unsigned long long>(set.key_offset),
                        static_cast<unsigned long long>(set.length),
                        set.local_set.size());
            print_local_set(cursor, set.local_set, max_bytes);
        }
        if (r.status != KlvStatus::Ok) {
            std::fprintf(stderr, "klvdump: decode of `%s` failed: %s\n", path,
                         klv_status_name(r.status));
            exit_code = 1;
        }
    }

    return exit_code;
}
