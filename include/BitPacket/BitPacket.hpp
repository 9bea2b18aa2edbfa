#pragma once
// BitPacket.hpp – Convenience header pulling in the whole public API.

#include "BitPacket/Array.hpp"
#include "BitPacket/BitField.hpp"
#include "BitPacket/BitStream.hpp"
#include "BitPacket/Config.hpp"
#include "BitPacket/Container.hpp"
#include "BitPacket/Data.hpp"
#include "BitPacket/Error.hpp"
#include "BitPacket/Field.hpp"
#include "BitPacket/Mask.hpp"
#include "BitPacket/MetaField.hpp"
#include "BitPacket/Number.hpp"
#include "BitPacket/Options.hpp"
#include "BitPacket/Resolver.hpp"
#include "BitPacket/Stream.hpp"
#include "BitPacket/String.hpp"
#include "BitPacket/Structure.hpp"
#include "BitPacket/Value.hpp"
