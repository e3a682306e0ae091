#pragma once

#include "auth_error.hpp"
#include "cryptography/base64.hpp"
#include "cryptography/payload_hasher.hpp"
#include "cryptography/signature_verifier.hpp"
#include "data/data.hpp"
#include "service/auth_token_service.hpp"
#include "signer/noscrypt_signer.hpp"
#include "signer/signer.hpp"
#include "signer/signer_registry.hpp"
#include "signer/signer_session.hpp"
