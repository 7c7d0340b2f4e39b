/**
 *  Version.hpp
 *  SNRScripter
 *
 *  Engine version macros.
 *
 *  Consult LICENSE file for licensing terms and copyright holders.
 */

#pragma once

#define macro_xstr(s) macro_str(s)
#define macro_str(s) #s

#define VER_NUMBER 20261017-snr
#define SNR_VERSION macro_xstr(VER_NUMBER)
#define SNR_CODENAME macro_xstr(Rokkenjima)

#define VERSION_STR1 "SNRScripter"
#define VERSION_STR2 "Consult LICENSE file for licensing terms and copyright holders."

