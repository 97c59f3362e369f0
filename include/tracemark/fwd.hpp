#pragma once

#include <cstdint>

namespace tracemark
{

struct AppConfig;
struct Color;
struct MarkingRecord;
struct MarkingSnapshot;
struct SessionEvents;

class DataItem;
class Marking;
class Series;
class SeriesSource;
class SessionModel;
class Logger;

enum class IndexKind;
enum class Label : uint8_t;
enum class Status;

}   // namespace tracemark
