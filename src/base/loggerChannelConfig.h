/** Log channel configuration

XP_LOGGER_CONFIG_START(xpLogChannel_<channel_id1>, xpLogChannel_<channel_id2>,...)

//always configure the default channel. Normally it does not have a prefix displayed
     XP_LOGCHANNEL(default, NULL, Debug, 0);
     XP_LOGCHANNEL(<channel_id1>, "<prefix1>", <debug_level1>, <channel_flags>);
     ...
//optional settings. You can call any methods of xmpres::Logger here, but you must
//enclose each line in a XP_LOGGER_CONFIG() macro. No semicolon required at end of line.
    XP_LOGGER_CONFIG(logToConsole()) //enable console logging, disabled by default
XP_LOGGER_CONFIG_END()

All listed channels must be configured. If some is missed, this will result in an error
message on the console and application abort.

<debug_level> can be: Debug,Verbose,Info,Warn,Error. Note that this is not in quotes
<prefix> the string that is prefixed before each log line for that channel. Can be NULL
<channel_flags> - currently only the lower 4 bits are used, which define the color of the messages in the console:
    0-7 correspond to terminal escape codes \033[0;30m - \033[0;37m. These are dark colors
    8-15 correspond to terminal escape codes \033[1;30m - \033[1;37m. These are bright colors

Levels can be overridden at startup with the XMPRES_LOG env variable, i.e.
    XMPRES_LOG="all=warn,roster=debug"
*/

XP_LOGGER_CONFIG_START(
        xpLogChannel_presence, xpLogChannel_roster,
        xpLogChannel_idle, xpLogChannel_strophe)
    XP_LOGCHANNEL(default, NULL, Debug, 0)
    XP_LOGCHANNEL(presence, "selfpres", Verbose, 14)
    XP_LOGCHANNEL(roster, "roster", Verbose, 12)
    XP_LOGCHANNEL(idle, "idle", Info, 10)
    XP_LOGCHANNEL(strophe, "strophe", Warn, 13)

    XP_LOGGER_CONFIG(setFlags(xpLogNoLevel))
    XP_LOGGER_CONFIG(logToConsole())
XP_LOGGER_CONFIG_END()
