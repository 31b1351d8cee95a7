#pragma once

#include <retrace/cache/BufferCodec.hpp>
#include <retrace/cache/CacheBackend.hpp>
#include <retrace/cache/CacheKey.hpp>
#include <retrace/cache/FileCacheBackend.hpp>
#include <retrace/cache/MemoryCacheBackend.hpp>
#include <retrace/cache/ReplayCache.hpp>
#include <retrace/config/RetraceOptions.hpp>
#include <retrace/core/Digest.hpp>
#include <retrace/core/Error.hpp>
#include <retrace/engine/ResolutionEngine.hpp>
#include <retrace/history/Action.hpp>
#include <retrace/history/ActionCodec.hpp>
#include <retrace/history/ActionStack.hpp>
#include <retrace/image/ImageBuffer.hpp>
#include <retrace/image/ImageCodec.hpp>
#include <retrace/ops/Operation.hpp>
#include <retrace/ops/OperationAdapter.hpp>
#include <retrace/ops/PixelOperationAdapter.hpp>
#include <retrace/region/RegionResolver.hpp>
#include <retrace/region/Selection.hpp>
#include <retrace/service/EditService.hpp>
#include <retrace/session/SessionRegistry.hpp>
