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

#pragma once
#include "encryptor.h"

namespace keep {

    /**
     * XOR with a repeating key, then base64.
     *
     * Obfuscation only: there is no authentication and the key stream
     * repeats. Substitute an AEAD implementation for real secrets.
     */
    class XorEncryptor : public Encryptor {
    public:
        // Throws KeepException(Encryption) for an empty key
        explicit XorEncryptor(std::string secure_key);

        std::string encrypt_sync(const std::string& plaintext) const override;

        // Throws KeepException(Encryption) when the input is not base64
        std::string decrypt_sync(const std::string& ciphertext) const override;

    private:
        std::string key_;
    };

} // namespace keep
