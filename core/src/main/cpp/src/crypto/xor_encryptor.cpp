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

#include "xor_encryptor.h"
#include "../keep_exception.h"
#include "../util/base64.h"

namespace keep {

    XorEncryptor::XorEncryptor(std::string secure_key) : key_(std::move(secure_key)) {
        if (key_.empty()) {
            throw KeepException(ErrorCode::Encryption, "XorEncryptor needs a non-empty key");
        }
    }

    std::string XorEncryptor::encrypt_sync(const std::string& plaintext) const {
        std::vector<uint8_t> out(plaintext.size());
        for (size_t i = 0; i < plaintext.size(); ++i) {
            out[i] = static_cast<uint8_t>(plaintext[i] ^ key_[i % key_.size()]);
        }
        return util::base64_encode(out);
    }

    std::string XorEncryptor::decrypt_sync(const std::string& ciphertext) const {
        std::optional<std::vector<uint8_t>> bytes = util::base64_decode(ciphertext);
        if (!bytes) {
            throw KeepException(ErrorCode::Encryption, "Ciphertext is not valid base64");
        }
        std::string out(bytes->size(), '\0');
        for (size_t i = 0; i < bytes->size(); ++i) {
            out[i] = static_cast<char>((*bytes)[i] ^ static_cast<uint8_t>(key_[i % key_.size()]));
        }
        return out;
    }

} // namespace keep
