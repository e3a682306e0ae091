#include <stdexcept>

#include <plog/Init.h>
#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "nostr_secure_rng.hpp"

using namespace std;
using namespace nip98::cryptography;

void NostrSecureRng::fill(void* buffer, size_t length)
{
	if (RAND_bytes(static_cast<uint8_t*>(buffer), static_cast<int>(length)) != 1)
	{
		PLOG_ERROR << "Failed to generate random bytes";
		throw runtime_error("NostrSecureRng::fill: Failed to generate random bytes.");
	}
}

void NostrSecureRng::zero(void* buffer, size_t length)
{
	OPENSSL_cleanse(buffer, length);
}
