#pragma once

#include <cstdint>

namespace xplorer
{

using TabId    = uint64_t;
using WindowId = uint64_t;

inline constexpr TabId    INVALID_TAB    = 0;
inline constexpr WindowId INVALID_WINDOW = 0;

namespace core
{
class EventLoop;
struct ShellConfig;
}   // namespace core

namespace ipc
{
class Value;
class RequestChannel;
class EventChannel;
class MessageBridge;
}   // namespace ipc

namespace state
{
class StateCoordinator;
class WindowSurface;
}   // namespace state

namespace ops
{
class OperationLifecycle;
class FileOperations;
}   // namespace ops

}   // namespace xplorer
