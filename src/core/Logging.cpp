#include "mdlog/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcParser, "mdlog.parser")
Q_LOGGING_CATEGORY(lcRoster, "mdlog.roster")
Q_LOGGING_CATEGORY(lcStorage, "mdlog.storage")
Q_LOGGING_CATEGORY(lcGenerator, "mdlog.generator")
Q_LOGGING_CATEGORY(lcSettings, "mdlog.settings")
Q_LOGGING_CATEGORY(lcCli, "mdlog.cli")
