#ifndef STITCHING_INICONFIGURATION_HXX
#define STITCHING_INICONFIGURATION_HXX

#include <string>

#include "SimpleIni.h"

#include "stitching/ConfigStitching.hxx"

#define INI_SECTION_DATA                    "DATA"
#define INI_SECTION_BLOCK_PROCESSING        "BLOCK_PROCESSING"
#define INI_SECTION_POST_PROCESSING         "POST_PROCESSING"
#define INI_SECTION_RUNTIME                 "RUNTIME"

namespace Stitching {

// "64, 64, 32" -> (64, 64, 32). Raises ConfigurationError unless there are exactly three entries.
volume_shape string2shape(const std::string &str, const char sep = ',');

// Values missing from the ini file keep the defaults of StitchConfiguration.
StitchConfiguration parseStitchConfiguration(const CSimpleIniA &ini);

// Raises ConfigurationError if the file cannot be loaded or holds invalid values.
StitchConfiguration loadStitchConfiguration(const std::string &fileini);

} /* namespace Stitching */

#endif /* STITCHING_INICONFIGURATION_HXX */
