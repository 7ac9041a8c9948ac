#pragma once

#include "errors.hpp"
#include "corpus.hpp"
#include "vocabulary.hpp"
#include "cooccurrence.hpp"
#include "reducer.hpp"
#include "embeddings.hpp"
#include "builder.hpp"
