#pragma once

#include "priv/common.hpp"

#include "priv/audio/AudioBuffer.hpp"
#include "priv/audio/AudioFileReader.hpp"
#include "priv/audio/AudioFileFactory.hpp"
#include "priv/audio/AudioCodec.hpp"

#include "priv/dsp/Window.hpp"
#include "priv/dsp/Stft.hpp"
#include "priv/dsp/MedianFilter.hpp"
#include "priv/dsp/BiquadFilter.hpp"
#include "priv/dsp/Convolution.hpp"
#include "priv/dsp/Normalization.hpp"

#include "priv/separation/HarmonicPercussiveSeparator.hpp"

#include "priv/effects/EffectType.hpp"
#include "priv/effects/EffectParameters.hpp"
#include "priv/effects/EffectsEngine.hpp"

#include "priv/tasks/TaskTypes.hpp"
#include "priv/tasks/TaskEngine.hpp"

#include "priv/service/ServiceConfiguration.hpp"
#include "priv/service/AudioJobService.hpp"
#include "priv/service/JsonSerialization.hpp"
