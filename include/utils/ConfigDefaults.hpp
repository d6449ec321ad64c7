#ifndef CONFIGDEFAULTS_HPP
#define CONFIGDEFAULTS_HPP

#include <cstddef>

namespace AdaptiveDefaults {

    // Predikciós kontextus ablaka (legutóbbi interakciók száma)
    constexpr std::size_t RECENT_WINDOW = 10;

    // Per-event feldolgozó workerek
    constexpr std::size_t PIPELINE_WORKERS = 2;

    // Előfizetői postafiók, telítettségnél a legrégebbi érték esik ki
    constexpr std::size_t PREDICTION_BUFFER = 16;

    // Adatbázis-kompatibilis felhasználói azonosító hossz
    constexpr std::size_t MAX_USER_ID_LENGTH = 255;

    // FrequencyLearningEngine: ennyi interakció után tekintjük "érettnek" a modellt
    constexpr double MATURITY_INTERACTIONS = 100.0;
}

#endif
