#pragma once

#include "soltx/compact_u16.hpp"
#include "soltx/connection.hpp"
#include "soltx/error.hpp"
#include "soltx/instruction.hpp"
#include "soltx/message.hpp"
#include "soltx/signer.hpp"
#include "soltx/transaction.hpp"
#include "soltx/types.hpp"
