#include <cstdlib>
#include <sstream>
#include <vector>

#include <boost/throw_exception.hpp>

#include "stitching/errors.hxx"
#include "stitching/iniConfiguration.hxx"

namespace Stitching {

volume_shape string2shape(const std::string &str, const char sep)
{
    std::vector<int > tokens;
    std::string tmp = str;
    size_t pos = tmp.find_first_of(sep);
    while (pos != std::string::npos) {
        tokens.push_back(atoi(tmp.substr(0, pos).c_str()));
        tmp = tmp.substr(pos+1, tmp.length());
        pos = tmp.find_first_of(sep);
    }
    tokens.push_back(atoi(tmp.c_str()));

    if (tokens.size() != 3)
        boost::throw_exception(ConfigurationError("string2shape(): expected three values, got '" + str + "'"));

    return volume_shape(tokens[0], tokens[1], tokens[2]);
}

namespace {
    // overwrite value only if the key is present
    void getString(const CSimpleIniA &ini, const char *section, const char *key, std::string &value)
    {
        const char *str = ini.GetValue(section, key, NULL);
        if (str != NULL)
            value = str;
    }

    void getInt(const CSimpleIniA &ini, const char *section, const char *key, int &value)
    {
        const char *str = ini.GetValue(section, key, NULL);
        if (str != NULL)
            value = atoi(str);
    }

    void getBool(const CSimpleIniA &ini, const char *section, const char *key, bool &value)
    {
        const char *str = ini.GetValue(section, key, NULL);
        if (str != NULL)
            value = atoi(str) != 0;
    }
} /* anonymous namespace */

StitchConfiguration parseStitchConfiguration(const CSimpleIniA &ini)
{
    StitchConfiguration conf;

    // data
    getString(ini, INI_SECTION_DATA, "path", conf.Filename);
    getString(ini, INI_SECTION_DATA, "input_group", conf.InputGroup);
    getString(ini, INI_SECTION_DATA, "input_variable", conf.InputVariable);
    getString(ini, INI_SECTION_DATA, "output_group", conf.OutputGroup);
    getString(ini, INI_SECTION_DATA, "output_variable", conf.OutputVariable);
    getString(ini, INI_SECTION_DATA, "mapping_variable", conf.MappingVariable);

    // block parameters
    const char *blockSize = ini.GetValue(INI_SECTION_BLOCK_PROCESSING, "block_size", NULL);
    if (blockSize != NULL)
        conf.BlockSize = string2shape(blockSize);
    getInt(ini, INI_SECTION_BLOCK_PROCESSING, "block_border", conf.Border);
    getBool(ini, INI_SECTION_BLOCK_PROCESSING, "relabel_blocks", conf.RelabelBlocks);
    getInt(ini, INI_SECTION_BLOCK_PROCESSING, "conn", conf.Connectivity);

    // post processing
    getBool(ini, INI_SECTION_POST_PROCESSING, "split_disconnected", conf.SplitDisconnected);

    // runtime and hdf5 settings
    getInt(ini, INI_SECTION_RUNTIME, "num_threads", conf.Threads);
    getInt(ini, INI_SECTION_RUNTIME, "verbose", conf.Verbose);
    getInt(ini, INI_SECTION_RUNTIME, "hdf_compression", conf.CompressionParameter);
    getInt(ini, INI_SECTION_RUNTIME, "hdf_chunk", conf.ChunkSize);

    // sanity checks
    std::ostringstream msg;
    if (conf.Filename.empty())
        msg << "[" << INI_SECTION_DATA << "] path is missing";
    else if (conf.BlockSize[0] <= 0 || conf.BlockSize[1] <= 0 || conf.BlockSize[2] <= 0)
        msg << "block_size has to be positive, got " << conf.BlockSize;
    else if (conf.Border < 0)
        msg << "block_border must not be negative, got " << conf.Border;
    else if (conf.Connectivity != 6 && conf.Connectivity != 26)
        msg << "conn has to be 6 or 26, got " << conf.Connectivity;
    else if (conf.Threads < 1)
        msg << "num_threads has to be at least 1, got " << conf.Threads;
    if (!msg.str().empty())
        boost::throw_exception(ConfigurationError("parseStitchConfiguration(): " + msg.str()));

    return conf;
}

StitchConfiguration loadStitchConfiguration(const std::string &fileini)
{
    CSimpleIniA ini;
    ini.SetUnicode();
    if (ini.LoadFile(fileini.c_str()) < 0)
        boost::throw_exception(ConfigurationError("loadStitchConfiguration(): cannot load " + fileini));

    return parseStitchConfiguration(ini);
}

} /* namespace Stitching */
