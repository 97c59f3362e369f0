#pragma once

#include <tracemark/color.hpp>
#include <tracemark/config.hpp>
#include <tracemark/data_item.hpp>
#include <tracemark/fwd.hpp>
#include <tracemark/label.hpp>
#include <tracemark/logger.hpp>
#include <tracemark/marking.hpp>
#include <tracemark/metadata.hpp>
#include <tracemark/series.hpp>
#include <tracemark/series_source.hpp>
#include <tracemark/session_events.hpp>
#include <tracemark/session_model.hpp>
