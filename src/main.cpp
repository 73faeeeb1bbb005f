/**
 * @file main.cpp
 * @brief Point d'entrée du simulateur de dialogue Cascade
 * @version 1.0
 * @date 2026-10-19
 *
 * Quatre personnages (Orion, Nova, Echo, Lumen) conversent dans une
 * simulation qu'ils soupçonnent d'être observée. Le directeur produit
 * les répliques au rythme de la tension narrative ; les spectateurs
 * interviennent par messages et commandes « ! ».
 */

#include "DialogueDirector.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace cascade;

// Signal handler pour arrêt propre
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    std::cout << "\n[Main] Signal " << signal << " reçu, arrêt en cours...\n";
    g_running.store(false);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Affiche cette aide\n"
              << "  -c, --config <file>   Fichier de configuration JSON\n"
              << "  --seed <n>            Graine aléatoire (0 = non déterministe)\n"
              << "  --ticks <n>           Nombre de messages avant arrêt (0 = illimité)\n"
              << "  --quiet               Journal réduit aux répliques\n"
              << "  --demo                Scénario de démonstration (horloge simulée)\n"
              << "  --interactive         Mode spectateur interactif\n"
              << "\n";
}

void printMessage(const Message& message) {
    std::string tag;
    if (message.is_overseer) {
        tag = " ⚠";
    } else if (message.is_response_to_user) {
        tag = " ↩";
    }
    std::cout << std::left << std::setw(9) << message.speaker << std::right
              << "[" << intentToString(message.intent) << "]" << tag << " "
              << message.text << "\n";
}

void printStats(const DialogueDirector& director) {
    const DirectorStats stats = director.getStats();
    std::cout << "\n╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                    STATISTIQUES SESSION                       ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "  Ticks                : " << stats.ticks << "\n";
    std::cout << "  Répliques émises     : " << stats.messages_emitted << "\n";
    std::cout << "  Interventions Overseer: " << stats.overseer_messages << "\n";
    std::cout << "  Réponses spectateurs : " << stats.user_responses << "\n";
    std::cout << "  Messages écartés     : " << stats.dropped_user_messages << "\n";
    std::cout << "  Fils ouverts         : " << stats.threads_started << "\n";
    std::cout << "  Fils épuisés         : " << stats.stale_exhaustions << "\n";
    std::cout << "  Répliques de secours : " << stats.fallback_lines << "\n";
    std::cout << "  Déclencheurs d'état  : " << stats.triggers_fired << "\n\n";
}

void runInteractive(DialogueDirector& director) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              MODE SPECTATEUR - Cascade interactive            ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n\n";
    std::cout << "[Interactif] Tapez un message pour les personnages (ou 'quit').\n";
    std::cout << "[Interactif] Commandes: !glitch, !tension, !observe, !question,\n";
    std::cout << "             /tick [n], /say <nom>, /state, /json, /history,\n";
    std::cout << "             /crisis, /reset, /quiet, /help\n\n";

    bool crisis = false;
    bool quiet = director.config().quiet;
    std::string input;
    while (g_running.load()) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, input)) {
            break;
        }

        if (input.empty()) continue;
        if (input == "quit" || input == "exit" || input == "q") {
            std::cout << "[Interactif] Au revoir!\n";
            break;
        }

        if (input.rfind("/tick", 0) == 0) {
            int count = 1;
            if (input.size() > 6) {
                try {
                    count = std::stoi(input.substr(6));
                } catch (const std::exception&) {
                    std::cerr << "[Interactif] Nombre invalide: " << input.substr(6) << "\n";
                    continue;
                }
            }
            for (int i = 0; i < count && g_running.load(); ++i) {
                // Attente jusqu'à l'échéance du rythme
                std::this_thread::sleep_until(director.nextEligibleTime());
                if (auto message = director.produceNextMessage()) {
                    printMessage(*message);
                }
            }
            continue;
        }

        if (input.rfind("/say ", 0) == 0) {
            if (auto message = director.produceMessageFrom(input.substr(5))) {
                printMessage(*message);
            }
            continue;
        }

        if (input == "/state") {
            std::cout << director.debugSnapshot();
            continue;
        }

        if (input == "/json") {
            std::cout << director.toJson().dump(2) << "\n";
            continue;
        }

        if (input == "/history") {
            for (const auto& event : director.getNarrativeHistory(15)) {
                std::cout << "  [boucle " << event.loop << "] " << event.type
                          << (event.actor.empty() ? "" : " (" + event.actor + ")")
                          << (event.description.empty() ? "" : ": " + event.description) << "\n";
            }
            continue;
        }

        if (input == "/crisis") {
            crisis = !crisis;
            director.notifyCrisisMode(crisis);
            std::cout << "[Mode] Crise " << (crisis ? "ACTIVÉE" : "DÉSACTIVÉE") << "\n";
            continue;
        }

        if (input == "/reset") {
            director.resetSession();
            continue;
        }

        if (input == "/quiet") {
            quiet = !quiet;
            director.setQuietMode(quiet);
            std::cout << "[Mode] Logs " << (quiet ? "DÉSACTIVÉS" : "ACTIVÉS") << "\n";
            continue;
        }

        if (input == "/help") {
            std::cout << "Commandes disponibles:\n";
            std::cout << "  !glitch    - Provoque un glitch\n";
            std::cout << "  !tension   - Augmente la tension\n";
            std::cout << "  !observe   - Se signale comme observateur\n";
            std::cout << "  !question  - Demande aux personnages s'ils sont réels\n";
            std::cout << "  /tick [n]  - Laisse la conversation avancer de n répliques\n";
            std::cout << "  /say <nom> - Fait parler Orion, Nova, Echo ou Lumen\n";
            std::cout << "  /state     - Affiche l'état narratif\n";
            std::cout << "  /json      - Exporte l'état en JSON\n";
            std::cout << "  /history   - Derniers événements narratifs\n";
            std::cout << "  /crisis    - Active/désactive le mode crise\n";
            std::cout << "  /reset     - Nouvelle boucle\n";
            std::cout << "  /quiet     - Active/désactive les logs\n";
            std::cout << "  quit       - Quitte\n";
            continue;
        }

        // Message spectateur : traité en priorité au tick suivant
        director.enqueueUserMessage("viewer", input);
        director.reportExternalActivity();
        if (auto message = director.produceNextMessage()) {
            printMessage(*message);
        }
    }
}

void runDemo(const CascadeConfig& config) {
    std::cout << "\n[Demo] Mode démonstration - horloge simulée, une seconde par tick\n\n";

    TimePoint simulated = SteadyClock::now();
    DialogueDirector director(config, [&simulated]() { return simulated; });

    auto advance = [&](int ticks) {
        for (int i = 0; i < ticks && g_running.load(); ++i) {
            simulated += std::chrono::seconds(1);
            if (auto message = director.produceNextMessage()) {
                printMessage(*message);
            }
        }
    };

    // Scénario 1: conversation spontanée
    std::cout << "═══ Scénario 1: Conversation spontanée ═══\n";
    advance(40);

    // Scénario 2: un spectateur intervient
    std::cout << "\n═══ Scénario 2: Un spectateur se manifeste ═══\n";
    director.enqueueUserMessage("viewer42", "Hello? Can you hear me? Is this a simulation?");
    director.enqueueUserMessage("viewer42", "!observe");
    advance(20);

    // Scénario 3: glitches et montée de tension
    std::cout << "\n═══ Scénario 3: Glitches et montée de tension ═══\n";
    director.enqueueUserMessage("viewer42", "!glitch");
    director.enqueueUserMessage("viewer7", "!tension");
    director.enqueueUserMessage("viewer7", "!tension");
    advance(30);

    // Scénario 4: crise
    std::cout << "\n═══ Scénario 4: ⚠ Mode crise ═══\n";
    director.notifyCrisisMode(true);
    advance(20);
    director.notifyCrisisMode(false);

    // Scénario 5: nouvelle boucle
    std::cout << "\n═══ Scénario 5: Réinitialisation de la boucle ═══\n";
    director.resetSession();
    advance(30);

    std::cout << "\n" << director.debugSnapshot();
    printStats(director);
}

int main(int argc, char* argv[]) {
    // Configuration par défaut
    CascadeConfig config;
    std::string config_file = "cascade_config.json";
    bool demo_mode = false;
    bool interactive_mode = false;
    bool quiet_flag = false;
    long seed_override = -1;
    long max_messages = 0;

    // Parser les arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                config_file = argv[++i];
            }
        } else if (arg == "--seed" || arg == "--ticks") {
            if (i + 1 < argc) {
                try {
                    long value = std::stol(argv[++i]);
                    (arg == "--seed" ? seed_override : max_messages) = value;
                } catch (const std::exception&) {
                    std::cerr << "[Main] Valeur invalide pour " << arg << ": " << argv[i] << "\n";
                    return 1;
                }
            }
        } else if (arg == "--quiet") {
            quiet_flag = true;
        } else if (arg == "--demo") {
            demo_mode = true;
        } else if (arg == "--interactive") {
            interactive_mode = true;
        }
    }

    // Installer le signal handler
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        std::cout << "[Main] Chargement configuration..." << std::endl;
        if (std::ifstream(config_file).good()) {
            if (!config.loadConfig(config_file)) {
                std::cerr << "[Main] Configuration invalide: " << config_file << std::endl;
                return 1;
            }
            std::cout << "[Main] Configuration chargée: " << config_file << std::endl;
        } else {
            std::cout << "[Main] Fichier config non trouvé, utilisation des valeurs par défaut" << std::endl;
        }

        if (seed_override >= 0) {
            config.seed = static_cast<uint64_t>(seed_override);
        }
        if (quiet_flag) {
            config.quiet = true;
        }

        if (demo_mode) {
            runDemo(config);
            std::cout << "[Main] Démonstration terminée.\n";
            return 0;
        }

        DialogueDirector director(config);

        if (interactive_mode) {
            runInteractive(director);
        } else {
            // Mode continu : une réplique à chaque échéance du rythme
            std::cout << "[Main] Simulation active. Appuyez sur Ctrl+C pour arrêter." << std::endl;

            long emitted = 0;
            while (g_running.load() && (max_messages == 0 || emitted < max_messages)) {
                if (auto message = director.produceNextMessage()) {
                    printMessage(*message);
                    emitted++;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        printStats(director);
        std::cout << "[Main] Cascade terminé proprement.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[Main] Erreur fatale: " << e.what() << "\n";
        return 1;
    }
}
