/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

/*
 * keep_inspect: print what a keep storage directory holds.
 *
 *   keep_inspect <root> [--values]
 *
 * <root> is the folder passed to Keep::init (e.g. <path>/keep). Headers
 * are always shown; --values also prints plain payloads. Secure payloads
 * are never decrypted.
 */

#include <iomanip>
#include <iostream>
#include <string>

#include "../src/codec/codec.h"
#include "../src/keep_exception.h"
#include "../src/persistence/platform_fs.h"
#include "../src/persistence/storage_config.h"
#include "../src/util/log.h"

using namespace keep;
using namespace keep::persist;
using namespace std;

static string flags_to_string(uint8_t flags) {
    string out;
    out += (flags & FLAG_REMOVABLE) ? 'r' : '-';
    out += (flags & FLAG_SECURE) ? 's' : '-';
    return out;
}

static void print_header(const RecordHeader& h) {
    cout << "  v" << static_cast<int>(h.version)
         << "  " << flags_to_string(h.flags)
         << "  " << setw(6) << left << valueTypeToString(h.type) << right
         << "  " << h.physical_id;
    if (!h.logical_name.empty() && h.logical_name != h.physical_id) {
        cout << "  (" << h.logical_name << ")";
    }
}

static int inspect_consolidated(const string& path, bool values) {
    auto [r, bytes] = PlatformFS::read_file(path);
    if (!r.ok) {
        cerr << path << ": " << errnoWithDescription(r.err) << "\n";
        return r.err == ENOENT ? 0 : 1;
    }

    cout << path << " (" << bytes.size() << " bytes)\n";
    try {
        for (const auto& kv : decode_all(bytes)) {
            print_header(kv.second.header);
            if (values && !kv.second.header.secure()) {
                cout << " = " << kv.second.value.to_string();
            }
            cout << "\n";
        }
    } catch (const KeepException& e) {
        cerr << "  unreadable: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

static int inspect_external(const string& dir, const StorageConfig& config, bool values) {
    auto [r, names] = PlatformFS::list_files(dir);
    if (!r.ok) {
        cerr << dir << ": " << errnoWithDescription(r.err) << "\n";
        return r.err == ENOENT ? 0 : 1;
    }

    cout << dir << " (" << names.size() << " files)\n";
    const string tmp_suffix = TMP_SUFFIX;
    int rc = 0;
    for (const auto& name : names) {
        const string path = dir + "/" + name;
        if (name.size() > tmp_suffix.size() &&
            name.compare(name.size() - tmp_suffix.size(), tmp_suffix.size(), tmp_suffix) == 0) {
            cout << "  orphaned temp file " << name << "\n";
            continue;
        }

        if (!values) {
            auto [pr, prefix] = PlatformFS::read_prefix(path, config.header_prefix_bytes);
            std::optional<RecordHeader> h = pr.ok ? parse_header(prefix.data(), prefix.size()) : std::nullopt;
            if (!h) {
                cout << "  ??  " << name << "  unreadable header\n";
                rc = 1;
                continue;
            }
            print_header(*h);
            cout << "\n";
            continue;
        }

        auto [fr, bytes] = PlatformFS::read_file(path);
        std::optional<StoredRecord> rec = fr.ok ? decode_record(bytes) : std::nullopt;
        if (!rec) {
            cout << "  ??  " << name << "  undecodable\n";
            rc = 1;
            continue;
        }
        print_header(rec->header);
        if (!rec->header.secure()) {
            cout << " = " << rec->value.to_string();
        }
        cout << "\n";
    }
    return rc;
}

int main(int argc, char** argv) {
    string root;
    bool values = false;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == "--values") {
            values = true;
        } else if (arg == "-h" || arg == "--help") {
            cout << "usage: keep_inspect <root> [--values]\n";
            return 0;
        } else if (root.empty()) {
            root = arg;
        } else {
            cerr << "unexpected argument: " << arg << "\n";
            return 2;
        }
    }
    if (root.empty()) {
        cerr << "usage: keep_inspect <root> [--values]\n";
        return 2;
    }

    initLoggingFromEnv();
    const StorageConfig config = StorageConfig::defaults();

    int rc = inspect_consolidated(root + "/" + config.main_file_name, values);
    rc |= inspect_external(root + "/" + config.external_dir_name, config, values);
    return rc;
}
